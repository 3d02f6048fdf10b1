#ifndef EDITCORE_BUFFER_ROPE_BUFFER_H
#define EDITCORE_BUFFER_ROPE_BUFFER_H

#include "editcore/buffer/text_buffer.h"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace editcore {

/**
 * RopeBuffer: document backend for large, multi-line text.
 *
 * Text is held in UTF-8 chunks (at most kMaxChunkBytes, always cut on
 * character boundaries) stored in-order in a treap. Every node caches the
 * byte, character, newline and node counts of its subtree, so offset, line
 * and character lookups descend one path: O(log n) plus one chunk scan.
 * Edits split out only the chunks they touch.
 */
class RopeBuffer final : public TextBuffer {
public:
    static constexpr std::size_t kMaxChunkBytes = 1024;

    RopeBuffer();
    explicit RopeBuffer(std::string_view text);
    ~RopeBuffer() override;

    RopeBuffer(const RopeBuffer&) = delete;
    RopeBuffer& operator=(const RopeBuffer&) = delete;

    std::size_t lenBytes() const override;
    std::size_t lenChars() const override;
    std::size_t lineCount() const override;

    std::size_t lineStartOffset(std::size_t line) const override;
    std::size_t lineAtOffset(std::size_t byte) const override;
    std::size_t byteToChar(std::size_t byte) const override;
    std::size_t charToByte(std::size_t charIndex) const override;
    bool isCharBoundary(std::size_t byte) const override;

    std::string slice(ByteRange range) const override;
    void forEachChunk(ByteRange range, const ChunkVisitor& visit) const override;

    std::size_t chunkCount() const;

protected:
    void insertBytes(std::size_t offset, std::string_view text) override;
    void removeBytes(std::size_t start, std::size_t end) override;
    void assign(std::string_view text) override;

private:
    struct Node;
    using NodePtr = std::unique_ptr<Node>;

    struct Location {
        const Node* node = nullptr;
        std::size_t index = 0;         // in-order node index
        std::size_t offsetInNode = 0;  // byte offset within node->text
        std::size_t charsBefore = 0;
        std::size_t newlinesBefore = 0;
    };

    static void update(Node* n);
    static NodePtr merge(NodePtr a, NodePtr b);
    static std::pair<NodePtr, NodePtr> split(NodePtr t, std::size_t count);
    static void appendRange(const Node* n, std::size_t start, std::size_t end, std::string& out);
    static bool visitRange(const Node* n, std::size_t start, std::size_t end, const ChunkVisitor& visit);

    NodePtr makeNode(std::string text);
    NodePtr build(std::string_view text);
    Location locateByte(std::size_t byte) const;
    std::uint32_t nextPriority();

    NodePtr root_;
    std::uint32_t seed_ = 0x9E3779B9u;
};

} // namespace editcore

#endif // EDITCORE_BUFFER_ROPE_BUFFER_H
