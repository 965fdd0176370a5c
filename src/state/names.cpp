#include "zshrcman/names.hpp"

#include <cstddef>
#include <string>

namespace zshrcman {

namespace {

constexpr std::size_t MAX_NAME_LENGTH = 128;

bool is_control(unsigned char c) {
    return c < 0x20 || c == 0x7f;
}

Result<void> reject(const std::string& kind, const std::string& what) {
    return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                   "invalid " + kind + " name: " + what));
}

bool is_alias_name_char(unsigned char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '_': case '-': case '.': case ':': case '+': case '@':
            return true;
        default:
            return false;
    }
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0)) return false;
    }
    return true;
}

// Text placed inside double quotes in generated scripts
bool is_safe_script_text(const std::string& s) {
    if (!is_valid_utf8(s)) return false;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_control(c) || c == '"' || c == '`') return false;
    }
    return true;
}

} // namespace

bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        unsigned int cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range code points
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

Result<void> validate_name(const std::string& kind, const std::string& name) {
    if (name.empty()) {
        return reject(kind, "name is empty");
    }
    if (name == "." || name == "..") {
        return reject(kind, "'" + name + "' is reserved");
    }
    if (name.size() > MAX_NAME_LENGTH) {
        return reject(kind, "longer than " + std::to_string(MAX_NAME_LENGTH) + " bytes");
    }
    if (!is_valid_utf8(name)) {
        return reject(kind, "not valid UTF-8");
    }
    if (name.front() == '-') {
        return reject(kind, "'" + name + "' starts with '-'");
    }

    for (char ch : name) {
        if (is_control(static_cast<unsigned char>(ch))) {
            return reject(kind, "contains a control character");
        }
    }
    for (char ch : name) {
        switch (ch) {
            case '/': case '\\': case ':':
                return reject(kind, "'" + name + "' contains a path separator");
            case '"': case '\'': case '`': case '$':
                return reject(kind, "'" + name + "' contains a shell quoting character");
            default:
                break;
        }
    }
    return Result<void>::ok();
}

Result<AliasDefinition> parse_alias_definition(const std::string& definition) {
    auto fail = [&](const std::string& why) {
        return Result<AliasDefinition>::err(
            Error(ErrorCode::INVALID_OPERATION, "invalid alias '" + definition + "': " + why));
    };

    auto eq = definition.find('=');
    if (eq == std::string::npos) {
        return fail("expected name=command");
    }

    AliasDefinition alias;
    alias.name = definition.substr(0, eq);
    alias.command = definition.substr(eq + 1);

    if (alias.name.empty()) return fail("name is empty");
    if (alias.name.size() > MAX_NAME_LENGTH) return fail("name is too long");
    for (char ch : alias.name) {
        if (!is_alias_name_char(static_cast<unsigned char>(ch))) {
            return fail("name may only use letters, digits and _-.:+@");
        }
    }

    if (alias.command.empty()) return fail("command is empty");
    if (!is_valid_utf8(alias.command)) return fail("command is not valid UTF-8");
    for (char ch : alias.command) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_control(c)) return fail("command contains a control character");
        if (c == '\'') return fail("command contains a single quote");
    }

    return Result<AliasDefinition>::ok(alias);
}

Result<void> validate_environment(const EnvironmentState& env) {
    auto fail = [](const std::string& why) {
        return Result<void>::err(Error(ErrorCode::INVALID_OPERATION, "invalid environment: " + why));
    };

    for (const auto* paths : {&env.paths_prepend, &env.paths_append}) {
        for (const auto& p : *paths) {
            if (p.empty()) return fail("empty path");
            if (!is_safe_script_text(p)) return fail("unsafe characters in path '" + p + "'");
        }
    }
    for (const auto& [key, value] : env.variables) {
        if (!is_identifier(key)) return fail("'" + key + "' is not a variable name");
        if (!is_safe_script_text(value)) return fail("unsafe characters in value of " + key);
    }
    for (const auto& [name, command] : env.aliases) {
        auto parsed = parse_alias_definition(name + "=" + command);
        if (parsed.isErr()) return Result<void>::err(parsed.error());
    }
    return Result<void>::ok();
}

} // namespace zshrcman
