#pragma once

#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace slideshow::util {

/*
  Wall-clock helpers. The ledger stores unix milliseconds; the API
  exposes google.protobuf.Timestamp.
*/

uint64_t NowMillis();

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

inline google::protobuf::Timestamp NowProto() {
  return MillisToProto(NowMillis());
}

} // namespace slideshow::util
