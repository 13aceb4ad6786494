#pragma once
#include <cstdint>
#include <string>

/// Human-readable byte count, 1 KB = 1024 bytes.
///   0          -> "---"
///   < 1 KB     -> "N bytes"
///   < 1 MB     -> "N KB"     (rounded to a whole number)
///   < 1 GB     -> "N.N MB"   (one decimal)
///   otherwise  -> "N.NN GB"  (two decimals)
/// Trailing decimal zeros are dropped, keeping at least one ("2.0 GB").
/// `tail` is appended verbatim, e.g. "/s".
std::string sizeFormat(int64_t size, const std::string& tail = "");
