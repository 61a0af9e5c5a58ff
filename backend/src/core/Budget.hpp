#pragma once
#include <string>
#include <cstdint>

struct Budget {
    std::int64_t id = 0;
    std::string name;
};

// Row as persisted: both fields are FieldCipher tokens.
struct StoredItem {
    std::int64_t id = 0;
    std::int64_t budget_id = 0;
    std::string description_token;
    std::string amount_token;
};
