#pragma once

#include <string>

namespace checkout::domain
{

    struct IdempotencyRecord
    {
        std::string key;
        int status;
        std::string body;
    };

} // namespace checkout::domain
