#include "conversation_store.h"
#include <stdexcept>
#include <utility>

namespace gptcli {

void ConversationStore::append(Message message) {
    // Empty content never enters the history
    if (message.content.empty()) {
        throw std::invalid_argument(std::string("Refusing to append empty ") + roleToString(message.role) + " message");
    }
    m_messages.push_back(std::move(message));
}

void ConversationStore::appendSystem(const std::string& content) {
    append(Message{Role::System, content});
}

void ConversationStore::appendUser(const std::string& content) {
    append(Message{Role::User, content});
}

void ConversationStore::appendAssistant(const std::string& content) {
    append(Message{Role::Assistant, content});
}

// Undo the most recent append (used when a request does not produce an accepted reply)
void ConversationStore::rollbackLast() {
    if (m_messages.empty()) {
        throw std::logic_error("rollbackLast() called on an empty conversation");
    }
    m_messages.pop_back();
}

} // namespace gptcli
