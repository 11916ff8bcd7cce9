#pragma once
#include <string>

#include "../protocol/resp_codec.h"

namespace keyscope {

// redis-cli style rendering:
//   nil            -> (nil)
//   empty array    -> (empty list)
//   array          -> "1) a\n2) b", nested arrays indented
//   integer        -> (integer) 42
//   error          -> (error) ERR ...
//   simple / bulk  -> the text itself
std::string format_reply(const resp::reply& r);

} // namespace keyscope
