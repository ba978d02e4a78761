#pragma once

#include <boost/leaf/error.hpp>
#include <boost/leaf/result.hpp>

namespace urnkit {

using boost::leaf::new_error;
using boost::leaf::result;

}  // namespace urnkit
