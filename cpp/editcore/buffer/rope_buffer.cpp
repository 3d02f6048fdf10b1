#include "editcore/buffer/rope_buffer.h"
#include "editcore/core/utf8.h"
#include <algorithm>

namespace editcore {

struct RopeBuffer::Node {
    std::string text;
    std::uint32_t priority = 0;
    std::size_t chars = 0;
    std::size_t newlines = 0;

    // Subtree aggregates, including this node.
    std::size_t sumBytes = 0;
    std::size_t sumChars = 0;
    std::size_t sumNewlines = 0;
    std::size_t count = 1;

    NodePtr left;
    NodePtr right;
};

namespace {

template <typename P>
std::size_t bytesOf(const P& n) { return n ? n->sumBytes : 0; }
template <typename P>
std::size_t charsOf(const P& n) { return n ? n->sumChars : 0; }
template <typename P>
std::size_t newlinesOf(const P& n) { return n ? n->sumNewlines : 0; }
template <typename P>
std::size_t countOf(const P& n) { return n ? n->count : 0; }

// Back off from limit to the nearest character boundary (never to 0).
std::size_t chunkCut(std::string_view text, std::size_t limit) {
    std::size_t cut = std::min(limit, text.size());
    while (cut > 0 && cut < text.size() && isContinuationByte(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    return cut == 0 ? std::min(limit, text.size()) : cut;
}

} // namespace

RopeBuffer::RopeBuffer() = default;

RopeBuffer::RopeBuffer(std::string_view text) {
    setContent(text);
}

RopeBuffer::~RopeBuffer() = default;

// =============================================================================
// Treap Maintenance
// =============================================================================

std::uint32_t RopeBuffer::nextPriority() {
    // xorshift32
    seed_ ^= seed_ << 13;
    seed_ ^= seed_ >> 17;
    seed_ ^= seed_ << 5;
    return seed_;
}

void RopeBuffer::update(Node* n) {
    n->sumBytes = n->text.size() + bytesOf(n->left) + bytesOf(n->right);
    n->sumChars = n->chars + charsOf(n->left) + charsOf(n->right);
    n->sumNewlines = n->newlines + newlinesOf(n->left) + newlinesOf(n->right);
    n->count = 1 + countOf(n->left) + countOf(n->right);
}

RopeBuffer::NodePtr RopeBuffer::merge(NodePtr a, NodePtr b) {
    if (!a) return b;
    if (!b) return a;
    if (a->priority > b->priority) {
        a->right = merge(std::move(a->right), std::move(b));
        update(a.get());
        return a;
    }
    b->left = merge(std::move(a), std::move(b->left));
    update(b.get());
    return b;
}

std::pair<RopeBuffer::NodePtr, RopeBuffer::NodePtr> RopeBuffer::split(NodePtr t, std::size_t count) {
    if (!t) return {nullptr, nullptr};
    if (countOf(t->left) >= count) {
        auto parts = split(std::move(t->left), count);
        t->left = std::move(parts.second);
        update(t.get());
        return {std::move(parts.first), std::move(t)};
    }
    auto parts = split(std::move(t->right), count - countOf(t->left) - 1);
    t->right = std::move(parts.first);
    update(t.get());
    return {std::move(t), std::move(parts.second)};
}

RopeBuffer::NodePtr RopeBuffer::makeNode(std::string text) {
    auto node = std::make_unique<Node>();
    node->chars = countChars(text);
    node->newlines = countNewlines(text);
    node->text = std::move(text);
    node->priority = nextPriority();
    update(node.get());
    return node;
}

RopeBuffer::NodePtr RopeBuffer::build(std::string_view text) {
    if (text.empty()) return nullptr;
    // Spread the bytes evenly so re-chunking an overfull node does not
    // leave a one-byte tail behind.
    const std::size_t pieces = (text.size() + kMaxChunkBytes - 1) / kMaxChunkBytes;
    const std::size_t target = (text.size() + pieces - 1) / pieces;

    NodePtr tree;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t len = chunkCut(text.substr(pos), target);
        tree = merge(std::move(tree), makeNode(std::string(text.substr(pos, len))));
        pos += len;
    }
    return tree;
}

RopeBuffer::Location RopeBuffer::locateByte(std::size_t byte) const {
    Location loc;
    const Node* n = root_.get();
    while (n) {
        const std::size_t leftBytes = bytesOf(n->left);
        if (byte < leftBytes) {
            n = n->left.get();
            continue;
        }
        const std::size_t nodeEnd = leftBytes + n->text.size();
        if (byte < nodeEnd || (byte == nodeEnd && !n->right)) {
            loc.node = n;
            loc.index += countOf(n->left);
            loc.offsetInNode = byte - leftBytes;
            loc.charsBefore += charsOf(n->left);
            loc.newlinesBefore += newlinesOf(n->left);
            return loc;
        }
        byte -= nodeEnd;
        loc.index += countOf(n->left) + 1;
        loc.charsBefore += charsOf(n->left) + n->chars;
        loc.newlinesBefore += newlinesOf(n->left) + n->newlines;
        n = n->right.get();
    }
    return loc;
}

// =============================================================================
// Size
// =============================================================================

std::size_t RopeBuffer::lenBytes() const { return bytesOf(root_); }
std::size_t RopeBuffer::lenChars() const { return charsOf(root_); }
std::size_t RopeBuffer::lineCount() const { return newlinesOf(root_) + 1; }
std::size_t RopeBuffer::chunkCount() const { return countOf(root_); }

// =============================================================================
// Addressing
// =============================================================================

std::size_t RopeBuffer::lineStartOffset(std::size_t line) const {
    if (line == 0) return 0;
    if (line >= lineCount()) return lenBytes();

    // Find the line-th newline (1-based).
    std::size_t remaining = line;
    std::size_t bytesBefore = 0;
    const Node* n = root_.get();
    while (n) {
        const std::size_t leftNewlines = newlinesOf(n->left);
        if (remaining <= leftNewlines) {
            n = n->left.get();
            continue;
        }
        remaining -= leftNewlines;
        bytesBefore += bytesOf(n->left);
        if (remaining <= n->newlines) {
            std::size_t pos = 0;
            for (;;) {
                pos = n->text.find('\n', pos);
                if (--remaining == 0) break;
                ++pos;
            }
            return bytesBefore + pos + 1;
        }
        remaining -= n->newlines;
        bytesBefore += n->text.size();
        n = n->right.get();
    }
    return lenBytes();
}

std::size_t RopeBuffer::lineAtOffset(std::size_t byte) const {
    if (!root_) return 0;
    const Location loc = locateByte(std::min(byte, lenBytes()));
    return loc.newlinesBefore + countNewlines(std::string_view(loc.node->text).substr(0, loc.offsetInNode));
}

std::size_t RopeBuffer::byteToChar(std::size_t byte) const {
    if (!root_) return 0;
    const Location loc = locateByte(std::min(byte, lenBytes()));
    return loc.charsBefore + countChars(std::string_view(loc.node->text).substr(0, loc.offsetInNode));
}

std::size_t RopeBuffer::charToByte(std::size_t charIndex) const {
    if (charIndex >= lenChars()) return lenBytes();

    std::size_t remaining = charIndex;
    std::size_t bytesBefore = 0;
    const Node* n = root_.get();
    while (n) {
        const std::size_t leftChars = charsOf(n->left);
        if (remaining < leftChars) {
            n = n->left.get();
            continue;
        }
        remaining -= leftChars;
        bytesBefore += bytesOf(n->left);
        if (remaining < n->chars) {
            return bytesBefore + charToByteIn(n->text, remaining);
        }
        remaining -= n->chars;
        bytesBefore += n->text.size();
        n = n->right.get();
    }
    return lenBytes();
}

bool RopeBuffer::isCharBoundary(std::size_t byte) const {
    const std::size_t total = lenBytes();
    if (byte == 0 || byte >= total) return byte <= total;
    const Location loc = locateByte(byte);
    return !isContinuationByte(static_cast<unsigned char>(loc.node->text[loc.offsetInNode]));
}

// =============================================================================
// Reading
// =============================================================================

void RopeBuffer::appendRange(const Node* n, std::size_t start, std::size_t end, std::string& out) {
    if (!n || start >= end) return;
    const std::size_t nodeStart = bytesOf(n->left);
    const std::size_t nodeEnd = nodeStart + n->text.size();
    if (start < nodeStart) {
        appendRange(n->left.get(), start, std::min(end, nodeStart), out);
    }
    if (start < nodeEnd && end > nodeStart) {
        const std::size_t from = std::max(start, nodeStart);
        const std::size_t to = std::min(end, nodeEnd);
        out.append(n->text, from - nodeStart, to - from);
    }
    if (end > nodeEnd) {
        appendRange(n->right.get(), start > nodeEnd ? start - nodeEnd : 0, end - nodeEnd, out);
    }
}

std::string RopeBuffer::slice(ByteRange range) const {
    const std::size_t total = lenBytes();
    const std::size_t start = std::min(range.start, total);
    const std::size_t end = std::min(range.end, total);
    std::string out;
    if (end <= start) return out;
    out.reserve(end - start);
    appendRange(root_.get(), start, end, out);
    return out;
}

// Returns false once visit asked to stop.
bool RopeBuffer::visitRange(const Node* n, std::size_t start, std::size_t end, const ChunkVisitor& visit) {
    if (!n || start >= end) return true;
    const std::size_t nodeStart = bytesOf(n->left);
    const std::size_t nodeEnd = nodeStart + n->text.size();
    if (start < nodeStart && !visitRange(n->left.get(), start, std::min(end, nodeStart), visit)) {
        return false;
    }
    if (start < nodeEnd && end > nodeStart) {
        const std::size_t from = std::max(start, nodeStart);
        const std::size_t to = std::min(end, nodeEnd);
        if (!visit(std::string_view(n->text).substr(from - nodeStart, to - from))) return false;
    }
    if (end > nodeEnd) {
        return visitRange(n->right.get(), start > nodeEnd ? start - nodeEnd : 0, end - nodeEnd, visit);
    }
    return true;
}

void RopeBuffer::forEachChunk(ByteRange range, const ChunkVisitor& visit) const {
    const std::size_t total = lenBytes();
    const std::size_t start = std::min(range.start, total);
    const std::size_t end = std::min(range.end, total);
    if (end <= start) return;
    visitRange(root_.get(), start, end, visit);
}

// =============================================================================
// Writing
// =============================================================================

void RopeBuffer::insertBytes(std::size_t offset, std::string_view text) {
    if (!root_) {
        root_ = build(text);
        return;
    }

    const Location loc = locateByte(offset);
    auto head = split(std::move(root_), loc.index);
    auto rest = split(std::move(head.second), 1);
    NodePtr target = std::move(rest.first);

    std::string merged;
    merged.reserve(target->text.size() + text.size());
    merged.append(target->text, 0, loc.offsetInNode);
    merged.append(text.data(), text.size());
    merged.append(target->text, loc.offsetInNode, std::string::npos);
    target.reset();

    root_ = merge(merge(std::move(head.first), build(merged)), std::move(rest.second));
}

void RopeBuffer::removeBytes(std::size_t start, std::size_t end) {
    const Location first = locateByte(start);
    const Location last = locateByte(end);

    // Keep the head of the first touched chunk and the tail of the last.
    std::string merged(first.node->text, 0, first.offsetInNode);
    merged.append(last.node->text, last.offsetInNode, std::string::npos);

    auto head = split(std::move(root_), first.index);
    auto rest = split(std::move(head.second), last.index - first.index + 1);
    rest.first.reset();

    root_ = merge(merge(std::move(head.first), build(merged)), std::move(rest.second));
}

void RopeBuffer::assign(std::string_view text) {
    root_ = build(text);
}

} // namespace editcore
