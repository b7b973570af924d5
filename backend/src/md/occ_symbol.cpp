#include "occ_symbol.hpp"

#include <chrono>

std::optional<OccSymbol> OccSymbol::parse(std::string_view contract)
{
    // 6 date digits + type + 8 strike digits
    constexpr std::size_t kTail = 15;
    if (contract.size() <= kTail) return std::nullopt;

    const std::string_view tail = contract.substr(contract.size() - kTail);
    std::string_view root = contract.substr(0, contract.size() - kTail);
    while (!root.empty() && root.back() == ' ') root.remove_suffix(1);
    if (root.empty() || root.size() > 6) return std::nullopt;

    for (std::size_t i = 0; i < kTail; ++i)
    {
        if (i == 6) continue;
        if (tail[i] < '0' || tail[i] > '9') return std::nullopt;
    }

    OccSymbol occ;
    occ.underlying = std::string(root);

    const char kind = tail[6];
    if (kind == 'C') occ.type = OptionType::Call;
    else if (kind == 'P') occ.type = OptionType::Put;
    else return std::nullopt;

    auto num = [&](std::size_t pos, std::size_t len) {
        int v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) v = v * 10 + (tail[i] - '0');
        return v;
    };

    using namespace std::chrono;
    const year_month_day ymd{year{2000 + num(0, 2)},
                             month{static_cast<unsigned>(num(2, 2))},
                             day{static_cast<unsigned>(num(4, 2))}};
    if (!ymd.ok()) return std::nullopt;
    occ.expiration = time_point_cast<nanoseconds>(sys_days{ymd});

    // strike is quoted in 1/1000 of a dollar
    const std::int64_t mills = num(7, 8);
    occ.strike = Decimal::from_units(mills * (Decimal::kUnit / 1000));
    if (occ.strike.is_zero()) return std::nullopt;

    return occ;
}
