#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "../crypto/FieldCipher.hpp"

// Placeholder shown for a field that failed to decrypt.
inline const std::string DECRYPT_ERROR_MARKER = "[Decryption Error]";

// One item after decryption. Each field keeps its own outcome, so a
// corrupted description doesn't hide a good amount (or the other way round).
struct ItemView {
    std::int64_t id = 0;
    DecryptResult description = DecryptResult::failure(DecryptErrorKind::MalformedEncoding, "");
    DecryptResult amount_text = DecryptResult::failure(DecryptErrorKind::MalformedEncoding, "");

    double amount = 0.0;       // meaningful only when amountValid
    bool amountValid = false;  // decrypted and parsed as a finite number

    bool fullyDecrypted() const { return description.ok() && amount_text.ok(); }
    std::string descriptionForDisplay() const { return description.valueOr(DECRYPT_ERROR_MARKER); }
};

struct BudgetListing {
    std::vector<ItemView> items;
    double total = 0.0;            // sum of valid amounts only
    std::size_t failedRows = 0;    // rows with a decrypt failure or unparsable amount
};

// Parses a decimal amount such as "3.50", "-12", " 1e2 ".
// Surrounding whitespace is allowed; hex, inf and nan are not.
bool parseAmount(const std::string& text, double& out);

inline bool isValidAmount(const std::string& text) {
    double unused;
    return parseAmount(text, unused);
}
