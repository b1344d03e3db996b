/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Act.hpp"
#include "Combatant.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

#include <cctype>
#include <optional>

using namespace std::literals;

namespace fray {

namespace {

struct Code {
    std::string_view name;
    std::string_view arg;
    size_t length; // of the whole code, including the leading dollar
};

// Parses name(arg) immediately following a dollar at pos.
std::optional<Code> parse_code(std::string_view format, size_t pos) {
    auto end = pos + 1;
    while (end < format.size() && std::isalpha(static_cast<unsigned char>(format[end])))
        ++end;
    if (end == pos + 1 || end >= format.size() || format[end] != '(')
        return std::nullopt;
    const auto close = format.find(')', end);
    if (close == std::string_view::npos)
        return std::nullopt;
    return Code{format.substr(pos + 1, end - pos - 1), format.substr(end + 1, close - end - 1), close - pos + 1};
}

const Combatant *referent(const Code &code, const Combatant *from, const NameMapping &mapping, Logger &logger,
                          std::string_view format) {
    if (code.arg.empty()) {
        if (!from)
            logger.warn("Act: ${}() used without a speaker in '{}'", code.name, format);
        return from;
    }
    if (auto it = mapping.find(code.arg); it != mapping.end())
        return it->second;
    logger.warn("Act: no combatant called '{}' for '{}'", code.arg, format);
    return nullptr;
}

std::string you(const Code &code, const Combatant &to, const Combatant *who) {
    const auto capital = code.name.front() == 'Y';
    if (who == &to)
        return capital ? "You" : "you";
    if (!who)
        return code.arg.empty() ? "someone" : std::string(code.arg);
    return std::string(who->name());
}

std::string your(const Code &code, const Combatant &to, const Combatant *who) {
    const auto capital = code.name.front() == 'Y';
    if (who == &to)
        return capital ? "Your" : "your";
    if (!who)
        return code.arg.empty() ? "someone's" : fmt::format("{}'s", code.arg);
    return fmt::format("{}'s", who->name());
}

}

std::string format_act(std::string_view format, const Combatant &to, const Combatant *from,
                       const NameMapping &mapping, Logger &logger) {
    std::string buf;
    for (size_t pos = 0; pos < format.size();) {
        const auto c = format[pos];
        if (c != '$') {
            buf.push_back(c);
            ++pos;
            continue;
        }
        if (pos + 1 < format.size() && format[pos + 1] == '$') {
            buf.push_back('$');
            pos += 2;
            continue;
        }
        const auto code = parse_code(format, pos);
        if (!code) {
            logger.warn("Act: malformed code at offset {} in '{}'", pos, format);
            buf.push_back(c);
            ++pos;
            continue;
        }
        if (code->name == "You"sv || code->name == "you"sv) {
            buf += you(*code, to, referent(*code, from, mapping, logger, format));
        } else if (code->name == "Your"sv || code->name == "your"sv) {
            buf += your(*code, to, referent(*code, from, mapping, logger, format));
        } else if (code->name == "conj"sv) {
            buf += (from == &to) ? std::string(code->arg) : third_person(code->arg);
        } else {
            logger.warn("Act: bad code ${} in '{}'", code->name, format);
            buf += format.substr(pos, code->length);
        }
        pos += code->length;
    }
    return upper_first_character(buf);
}

}
