#pragma once

#include "message.h"
#include <cstddef>
#include <string>
#include <vector>

namespace gptcli {

/*
 * In-memory, ordered history of the conversation.
 * The full sequence is replayed to the service on every request, so it must
 * only ever hold accepted exchanges (plus the seeded system messages).
 */
class ConversationStore {
public:
    ConversationStore() = default;

    /// Appends a message to the end of the history. Throws std::invalid_argument on empty content.
    void append(Message message);

    /// Convenience wrappers around append().
    void appendSystem(const std::string& content);
    void appendUser(const std::string& content);
    void appendAssistant(const std::string& content);

    /// Removes the most recently appended message. Throws std::logic_error when empty.
    void rollbackLast();

    /// Read-only view of the full history, in order.
    const std::vector<Message>& snapshot() const { return m_messages; }

    size_t size() const { return m_messages.size(); }
    bool empty() const { return m_messages.empty(); }

private:
    std::vector<Message> m_messages;
};

} // namespace gptcli
