#pragma once

#include <status-code/generic_code.hpp>

namespace sjson
{

using errc = SYSTEM_ERROR2_NAMESPACE::errc;

} // namespace sjson
