#pragma once

#include <string>

namespace gptcli {

enum class Role {
    System,
    User,
    Assistant
};

/// Represents a single message in the conversation.
struct Message {
    Role role = Role::User;
    std::string content;
};

inline bool operator==(const Message& lhs, const Message& rhs) {
    return lhs.role == rhs.role && lhs.content == rhs.content;
}

inline const char* roleToString(Role role) {
    switch (role) {
        case Role::System:    return "system";
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

} // namespace gptcli
