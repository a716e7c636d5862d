#pragma once

#include <ragchunk/language/language_profile.h>

#include <vector>

namespace ragchunk::language::detail {

// One profile per Language value, in enum order.
std::vector<LanguageProfile> makeBuiltinProfiles();

} // namespace ragchunk::language::detail
