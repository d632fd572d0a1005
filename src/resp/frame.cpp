#include "resp/frame.hpp"
#include "common/utf8.hpp"

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace respkv::resp {

namespace {

// Arbitrary constant mixed in for NaN so that every NaN hashes alike.
constexpr std::size_t kNanHash = 0x7ff8'0000'0000'0001ull;

std::strong_ordering compare_double(double a, double b) {
    const bool a_nan = std::isnan(a);
    const bool b_nan = std::isnan(b);
    if (a_nan || b_nan) {
        if (a_nan && b_nan) return std::strong_ordering::equal;
        return a_nan ? std::strong_ordering::greater : std::strong_ordering::less;
    }
    if (a < b) return std::strong_ordering::less;
    if (a > b) return std::strong_ordering::greater;
    return std::strong_ordering::equal; // also covers -0.0 vs 0.0
}

std::strong_ordering compare_sequences(const std::vector<Frame>& a, const std::vector<Frame>& b) {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (auto c = compare(a[i], b[i]); c != 0) {
            return c;
        }
    }
    return a.size() <=> b.size();
}

std::vector<Frame> sorted_copy(const std::vector<Frame>& items) {
    std::vector<Frame> out = items;
    std::sort(out.begin(), out.end(),
              [](const Frame& x, const Frame& y) { return compare(x, y) < 0; });
    return out;
}

std::size_t hash_double(double d) {
    if (std::isnan(d)) {
        return kNanHash;
    }
    if (d == 0.0) {
        d = 0.0; // fold -0.0 onto 0.0
    }
    return boost::hash<double>{}(d);
}

void render(const Frame& f, std::string& out, std::size_t indent);

void render_sequence(const std::vector<Frame>& items, std::string& out, std::size_t indent,
                     std::string_view empty_text) {
    if (items.empty()) {
        out += empty_text;
        return;
    }
    const std::size_t width = std::to_string(items.size()).size();
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += '\n';
            out.append(indent, ' ');
        }
        const auto label = fmt::format("{:>{}}) ", i + 1, width);
        out += label;
        render(items[i], out, indent + label.size());
    }
}

void render(const Frame& f, std::string& out, std::size_t indent) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                out += v.value;
            } else if constexpr (std::is_same_v<T, SimpleError>) {
                out += "(error) ";
                out += v.message;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out += fmt::format("(integer) {}", v);
            } else if constexpr (std::is_same_v<T, BulkString>) {
                out += '"';
                out += v.data;
                out += '"';
            } else if constexpr (std::is_same_v<T, Null>) {
                out += "(nil)";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += v ? "(true)" : "(false)";
            } else if constexpr (std::is_same_v<T, Double>) {
                out += fmt::format("(double) {}", v.value);
            } else if constexpr (std::is_same_v<T, Array>) {
                render_sequence(v.items, out, indent, "(empty array)");
            } else if constexpr (std::is_same_v<T, Set>) {
                render_sequence(sorted_copy(v.items), out, indent, "(empty set)");
            } else if constexpr (std::is_same_v<T, Map>) {
                if (v.entries.empty()) {
                    out += "(empty map)";
                    return;
                }
                const std::size_t width = std::to_string(v.entries.size()).size();
                std::size_t i = 0;
                for (const auto& [key, value] : v.entries) {
                    if (i > 0) {
                        out += '\n';
                        out.append(indent, ' ');
                    }
                    const auto label = fmt::format("{:>{}}# \"{}\" => ", ++i, width, key);
                    out += label;
                    render(value, out, indent + label.size());
                }
            }
        },
        f.value);
}

} // anonymous namespace

std::string_view to_string(FrameKind kind) noexcept {
    switch (kind) {
        case FrameKind::SimpleString: return "simple-string";
        case FrameKind::SimpleError:  return "simple-error";
        case FrameKind::Integer:      return "integer";
        case FrameKind::BulkString:   return "bulk-string";
        case FrameKind::Array:        return "array";
        case FrameKind::Null:         return "null";
        case FrameKind::Boolean:      return "boolean";
        case FrameKind::Double:       return "double";
        case FrameKind::Map:          return "map";
        case FrameKind::Set:          return "set";
    }
    return "unknown";
}

std::strong_ordering compare(const Frame& a, const Frame& b) {
    if (a.value.index() != b.value.index()) {
        return a.value.index() <=> b.value.index();
    }

    return std::visit(
        [&b](const auto& lhs) -> std::strong_ordering {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b.value);

            if constexpr (std::is_same_v<T, SimpleString>) {
                return lhs.value <=> rhs.value;
            } else if constexpr (std::is_same_v<T, SimpleError>) {
                return lhs.message <=> rhs.message;
            } else if constexpr (std::is_same_v<T, BulkString>) {
                return lhs.data <=> rhs.data;
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, bool>) {
                return lhs <=> rhs;
            } else if constexpr (std::is_same_v<T, Null>) {
                return std::strong_ordering::equal;
            } else if constexpr (std::is_same_v<T, Double>) {
                return compare_double(lhs.value, rhs.value);
            } else if constexpr (std::is_same_v<T, Array>) {
                return compare_sequences(lhs.items, rhs.items);
            } else if constexpr (std::is_same_v<T, Set>) {
                return compare_sequences(sorted_copy(lhs.items), sorted_copy(rhs.items));
            } else if constexpr (std::is_same_v<T, Map>) {
                auto it_a = lhs.entries.begin();
                auto it_b = rhs.entries.begin();
                for (; it_a != lhs.entries.end() && it_b != rhs.entries.end(); ++it_a, ++it_b) {
                    if (auto c = it_a->first <=> it_b->first; c != 0) return c;
                    if (auto c = compare(it_a->second, it_b->second); c != 0) return c;
                }
                return lhs.entries.size() <=> rhs.entries.size();
            }
        },
        a.value);
}

bool operator==(const Frame& a, const Frame& b) {
    return compare(a, b) == 0;
}

std::strong_ordering operator<=>(const Frame& a, const Frame& b) {
    return compare(a, b);
}

std::size_t hash_value(const Frame& f) {
    std::size_t seed = f.value.index();

    std::visit(
        [&seed](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                boost::hash_combine(seed, v.value);
            } else if constexpr (std::is_same_v<T, SimpleError>) {
                boost::hash_combine(seed, v.message);
            } else if constexpr (std::is_same_v<T, BulkString>) {
                boost::hash_combine(seed, v.data);
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, bool>) {
                boost::hash_combine(seed, v);
            } else if constexpr (std::is_same_v<T, Null>) {
                // kind alone
            } else if constexpr (std::is_same_v<T, Double>) {
                boost::hash_combine(seed, hash_double(v.value));
            } else if constexpr (std::is_same_v<T, Array>) {
                for (const auto& item : v.items) {
                    boost::hash_combine(seed, hash_value(item));
                }
            } else if constexpr (std::is_same_v<T, Set>) {
                for (const auto& item : sorted_copy(v.items)) {
                    boost::hash_combine(seed, hash_value(item));
                }
            } else if constexpr (std::is_same_v<T, Map>) {
                for (const auto& [key, value] : v.entries) {
                    boost::hash_combine(seed, key);
                    boost::hash_combine(seed, hash_value(value));
                }
            }
        },
        f.value);

    return seed;
}

std::string sanitize_line(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        const std::size_t len = utf8_sequence_length(text, i);
        if (len == 0 || c < 0x20 || c == 0x7F) {
            out += '?';
            ++i;
            continue;
        }
        out.append(text, i, len);
        i += len;
    }
    return out;
}

std::string to_string(const Frame& f) {
    std::string out;
    render(f, out, 0);
    return out;
}

} // namespace respkv::resp
