/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "flatten.hpp"
#include "payment_model.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace paymsg {

// Days since 1970-01-01 for a proleptic Gregorian date
inline std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153u * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2u) / 5u + static_cast<unsigned>(d) - 1u;
    const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Timestamp {
    std::int64_t seconds{0};     // UTC
    std::string fraction;        // 9 digits

    bool operator<(const Timestamp& o) const {
        return seconds != o.seconds ? seconds < o.seconds : fraction < o.fraction;
    }
};

// YYYY-MM-DD[THH:MM:SS[.fff][Z|+hh:mm|-hh:mm]]; nullopt when unreadable
inline std::optional<Timestamp> parse_timestamp(const std::string& raw) {
    const std::string s = trim_copy(raw);
    auto num = [&](size_t pos, size_t len, int& out) {
        if (pos + len > s.size()) return false;
        out = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            if (!is_digit(s[i])) return false;
            out = out * 10 + (s[i] - '0');
        }
        return true;
    };

    int y, mo, d, h = 0, mi = 0, se = 0;
    if (!num(0, 4, y) || s.size() < 10 || s[4] != '-' || !num(5, 2, mo) || s[7] != '-' || !num(8, 2, d))
        return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return std::nullopt;

    Timestamp ts;
    ts.fraction.assign(9, '0');
    size_t i = 10;
    int offset_min = 0;
    if (i < s.size() && (s[i] == 'T' || s[i] == ' ')) {
        if (!num(i + 1, 2, h) || s.size() < i + 9 || s[i + 3] != ':' || !num(i + 4, 2, mi) ||
            s[i + 6] != ':' || !num(i + 7, 2, se))
            return std::nullopt;
        i += 9;
        if (i < s.size() && s[i] == '.') {
            size_t k = 0;
            for (++i; i < s.size() && is_digit(s[i]); ++i, ++k)
                if (k < 9) ts.fraction[k] = s[i];
        }
        if (i < s.size()) {
            if (s[i] == 'Z') {
                ++i;
            } else if (s[i] == '+' || s[i] == '-') {
                int oh, om;
                if (!num(i + 1, 2, oh) || s.size() < i + 6 || s[i + 3] != ':' || !num(i + 4, 2, om))
                    return std::nullopt;
                offset_min = (s[i] == '+' ? 1 : -1) * (oh * 60 + om);
                i += 6;
            }
        }
    }
    if (i != s.size()) return std::nullopt;

    ts.seconds = days_from_civil(y, mo, d) * 86400 + h * 3600 + mi * 60 + se - offset_min * 60;
    return ts;
}

/**
 * Links messages of one payment into a lifecycle.
 *
 * Correlation keys, strongest first:
 *   1. UETR: when both sides carry one, equality decides either way
 *   2. end-to-end id
 *   3. original message id referencing the other message id
 *   4. shared case id (investigations)
 */
class Reconciler {
public:
    bool is_linked(const PaymentMessage& a, const PaymentMessage& b) const {
        if (a.uetr && b.uetr) return ascii_upper(*a.uetr) == ascii_upper(*b.uetr);
        if (a.end_to_end_id && b.end_to_end_id && *a.end_to_end_id == *b.end_to_end_id) return true;
        if (a.original_message_id && *a.original_message_id == b.message_id) return true;
        if (b.original_message_id && *b.original_message_id == a.message_id) return true;
        if (a.case_id && b.case_id && *a.case_id == *b.case_id) return true;
        return false;
    }

    // every candidate linked to primary, candidate order, primary itself skipped
    std::vector<PaymentMessage> find_matches(const PaymentMessage& primary,
                                             const std::vector<PaymentMessage>& candidates) const {
        std::vector<PaymentMessage> out;
        for (const auto& c : candidates) {
            if (same_message(primary, c)) continue;
            if (is_linked(primary, c)) out.push_back(c);
        }
        return out;
    }

    // Transitive closure of the seed over the pool. The pool is not modified.
    std::vector<PaymentMessage> trace_lifecycle(const PaymentMessage& seed,
                                                const std::vector<PaymentMessage>& pool) const {
        std::vector<bool> taken(pool.size(), false);
        bool seed_in_pool = false;
        for (size_t i = 0; i < pool.size(); ++i) {
            if (same_message(seed, pool[i])) { taken[i] = true; seed_in_pool = true; }
        }

        std::deque<const PaymentMessage*> queue{&seed};
        while (!queue.empty()) {
            const PaymentMessage* cur = queue.front();
            queue.pop_front();
            for (size_t i = 0; i < pool.size(); ++i) {
                if (taken[i] || !is_linked(*cur, pool[i])) continue;
                taken[i] = true;
                queue.push_back(&pool[i]);
            }
        }

        // seed in slot 0 when it comes from outside, then pool members in pool order
        std::vector<const PaymentMessage*> members;
        if (!seed_in_pool) members.push_back(&seed);
        for (size_t i = 0; i < pool.size(); ++i)
            if (taken[i]) members.push_back(&pool[i]);
        order_by_timestamp(members);

        std::vector<PaymentMessage> out;
        out.reserve(members.size());
        for (const PaymentMessage* m : members) out.push_back(*m);
        return out;
    }

private:
    static bool same_message(const PaymentMessage& a, const PaymentMessage& b) {
        if (&a == &b) return true;
        return a.raw_source == b.raw_source && flatten(a) == flatten(b);
    }

    // Timestamped messages are stably sorted among the slots they occupy;
    // the others keep their position.
    static void order_by_timestamp(std::vector<const PaymentMessage*>& v) {
        std::vector<size_t> slots;
        std::vector<std::pair<Timestamp, const PaymentMessage*>> stamped;
        for (size_t i = 0; i < v.size(); ++i) {
            if (!v[i]->creation_date_time) continue;
            auto ts = parse_timestamp(*v[i]->creation_date_time);
            if (!ts) continue;
            slots.push_back(i);
            stamped.emplace_back(*ts, v[i]);
        }
        std::stable_sort(stamped.begin(), stamped.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        for (size_t k = 0; k < slots.size(); ++k) v[slots[k]] = stamped[k].second;
    }
};

} // namespace paymsg
