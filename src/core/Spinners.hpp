#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace Tickbar {

size_t spinner_count();

// frames of spinner style `type`, 0 <= type < spinner_count()
const std::vector<std::string_view>& spinner_frames(int type);

} // namespace Tickbar
