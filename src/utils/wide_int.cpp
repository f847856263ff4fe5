#include "utils/wide_int.hpp"
#include <algorithm>
#include <stdexcept>

namespace pmkt {

namespace {

constexpr Price PRICE_MAX = ~static_cast<Price>(0);
constexpr Price AMOUNT_MAX = PRICE_MAX >> 1;

std::string render_unsigned(Price value) {
    if (value == 0) return "0";

    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

Price parse_digits(const std::string& text, size_t start, Price limit) {
    if (start >= text.size()) {
        throw std::invalid_argument("Empty numeric value: '" + text + "'");
    }

    Price value = 0;
    for (size_t i = start; i < text.size(); i++) {
        char c = text[i];
        if (c == '_') continue;  // allow 1_000_000 style separators
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid digit in numeric value: '" + text + "'");
        }
        Price digit = static_cast<Price>(c - '0');
        if (value > (limit - digit) / 10) {
            throw std::out_of_range("Numeric value out of range: '" + text + "'");
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

std::string amount_to_string(Amount value) {
    if (value >= 0) {
        return render_unsigned(static_cast<Price>(value));
    }
    // Negate in unsigned space so the minimum value does not overflow
    Price magnitude = static_cast<Price>(0) - static_cast<Price>(value);
    return "-" + render_unsigned(magnitude);
}

std::string price_to_string(Price value) {
    return render_unsigned(value);
}

Amount parse_amount(const std::string& text) {
    if (!text.empty() && text[0] == '-') {
        Price magnitude = parse_digits(text, 1, AMOUNT_MAX + 1);
        return static_cast<Amount>(static_cast<Price>(0) - magnitude);
    }
    return static_cast<Amount>(parse_digits(text, 0, AMOUNT_MAX));
}

Price parse_price(const std::string& text) {
    return parse_digits(text, 0, PRICE_MAX);
}

std::string format_scaled_price(Price scaled) {
    Price whole = scaled / PRECISION_SCALE;
    Price frac = scaled % PRECISION_SCALE;

    std::string frac_str = render_unsigned(frac);
    while (frac_str.size() < 4) {
        frac_str.insert(frac_str.begin(), '0');
    }
    return render_unsigned(whole) + "." + frac_str;
}

} // namespace pmkt
