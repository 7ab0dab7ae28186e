#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

using ScannerParam = std::variant<int64_t, std::string>;
using ScannerParams = std::map<std::string, ScannerParam>;

// Vendor or product ID, either as a hexadecimal string ("0402", "0x0204")
// or as a plain integer.
using UsbId = std::variant<std::string, int>;

uint16_t UsbIdToInt(const UsbId &id);

// Remaps the "vid" and "pid" aliases to "idVendor" and "idProduct" and
// converts their values to integers. An alias is dropped without effect when
// the canonical key is already present.
ScannerParams PreprocessScannerParams(ScannerParams params);

int64_t GetIntParam(const ScannerParams &params, const std::string &key);
std::string ScannerParamToString(const ScannerParam &param);
