#pragma once

#include <string_view>

#ifndef GITPROMPT_VERSION_MAJOR
#define GITPROMPT_VERSION_MAJOR 0
#endif

#ifndef GITPROMPT_VERSION_MINOR
#define GITPROMPT_VERSION_MINOR 0
#endif

#ifndef GITPROMPT_VERSION_PATCH
#define GITPROMPT_VERSION_PATCH 0
#endif

#ifndef GITPROMPT_VERSION_STRING
#define GITPROMPT_VERSION_STRING "0.0.0"
#endif

namespace gitprompt {

class Version {
public:
    static constexpr int Major() noexcept { return GITPROMPT_VERSION_MAJOR; }
    static constexpr int Minor() noexcept { return GITPROMPT_VERSION_MINOR; }
    static constexpr int Patch() noexcept { return GITPROMPT_VERSION_PATCH; }

    static constexpr std::string_view String() noexcept { return std::string_view{GITPROMPT_VERSION_STRING}; }
};

} // namespace gitprompt
