#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"

namespace io {

// time,open,high,low,close[,volume...] with a header line. Rows with missing,
// unparsable or non-finite prices are skipped. False if the file cannot be
// read or holds no usable row.
bool load_candles_csv(const std::string& path, std::vector<Candle>& out);

} // namespace io
