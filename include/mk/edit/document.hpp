#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

enum class NodeType
{
    Doc,
    Paragraph,
    Heading,
    CodeBlock,
    Blockquote,
    BulletList,
    OrderedList,
    ListItem,
    TaskList,
    TaskItem,
    Table,
    TableRow,
    TableHeader,
    TableCell,
    Image,
    HorizontalRule,
    HtmlBlock,
    MathBlock,
    Container
};

// Declaration order is the canonical order of marks inside a MarkSet.
enum class MarkType
{
    SyntaxMarker,
    Strong,
    Emphasis,
    CodeInline,
    Strikethrough,
    Highlight,
    Link,
    MathInline
};

enum class SyntaxType
{
    StrongEmphasis,
    Strong,
    Emphasis,
    CodeInline,
    Strikethrough,
    Highlight,
    Link,
    MathInline,
    Escape,
    Heading,
    Blockquote
};

enum class TableAlignment
{
    None,
    Left,
    Center,
    Right
};

enum class BlockGroupKind
{
    CodeBlock,
    Table,
    HtmlBlock,
    MathBlock
};

std::string_view nodeTypeName(NodeType type) noexcept;
std::string_view markTypeName(MarkType type) noexcept;
std::string_view syntaxTypeName(SyntaxType type) noexcept;
std::string_view alignmentName(TableAlignment align) noexcept;
std::optional<NodeType> nodeTypeFromName(std::string_view name) noexcept;
std::optional<SyntaxType> syntaxTypeFromName(std::string_view name) noexcept;

struct Mark
{
    MarkType type = MarkType::Strong;
    SyntaxType syntax = SyntaxType::Strong; // SyntaxMarker only
    std::string href;                       // Link
    std::string title;                      // Link
    std::string content;                    // MathInline

    static Mark syntaxMarker(SyntaxType syntax);
    static Mark semantic(MarkType type);
    static Mark link(std::string href, std::string title);
    static Mark math(std::string content);

    bool operator==(const Mark &other) const noexcept;
    bool operator!=(const Mark &other) const noexcept { return !(*this == other); }
};

// Sorted by MarkType, at most one mark of each type.
using MarkSet = std::vector<Mark>;

MarkSet withMark(MarkSet marks, const Mark &mark);
MarkSet withMarks(MarkSet marks, const MarkSet &added);
MarkSet withoutMark(MarkSet marks, MarkType type);
bool hasMark(const MarkSet &marks, MarkType type) noexcept;
const Mark *findMark(const MarkSet &marks, MarkType type) noexcept;
std::optional<SyntaxType> syntaxTypeOf(const MarkSet &marks) noexcept;

struct TextRun
{
    std::string text;
    MarkSet marks;

    bool operator==(const TextRun &other) const noexcept;
    bool operator!=(const TextRun &other) const noexcept { return !(*this == other); }
};

// Membership of a flattened paragraph in the structured block it came from.
struct BlockGroup
{
    BlockGroupKind kind = BlockGroupKind::CodeBlock;
    std::string id;
    std::size_t lineIndex = 0;
    std::size_t totalLines = 0;

    bool operator==(const BlockGroup &other) const noexcept;
};

struct ImageSource
{
    std::string src;
    std::string alt;
    std::string title;

    bool operator==(const ImageSource &other) const noexcept;
};

struct NodeAttrs
{
    int level = 0;                            // Heading
    std::string language;                     // CodeBlock
    std::size_t start = 1;                    // OrderedList
    bool checked = false;                     // TaskItem
    TableAlignment align = TableAlignment::None; // TableHeader, TableCell
    std::string src;                          // Image
    std::string alt;                          // Image
    std::string title;                        // Image
    std::string containerType;                // Container
    std::string containerTitle;               // Container

    // Transient paragraph attributes, present only in source view.
    std::optional<ImageSource> imageSource;
    bool hrSource = false;
    std::optional<BlockGroup> group;

    bool operator==(const NodeAttrs &other) const noexcept;
    bool operator!=(const NodeAttrs &other) const noexcept { return !(*this == other); }
    bool sameIgnoringTransient(const NodeAttrs &other) const noexcept;
};

bool isTextblockType(NodeType type) noexcept;
bool isLeafType(NodeType type) noexcept;

// A document tree node. Textblocks own text runs, other non-leaf nodes own
// child nodes, Image and HorizontalRule are leaves.
//
// Positions: every non-leaf node has an opening and a closing boundary, a
// leaf counts one and text counts one per byte. Positions passed to the
// editing functions are relative to the start of this node's content.
class Node
{
public:
    explicit Node(NodeType type = NodeType::Paragraph, NodeAttrs attrs = {});

    static Node textblock(NodeType type, std::vector<TextRun> runs, NodeAttrs attrs = {});
    static Node branch(NodeType type, std::vector<Node> children, NodeAttrs attrs = {});
    static Node paragraph(std::string_view text = {}, NodeAttrs attrs = {});

    NodeType type() const noexcept { return nodeType; }
    const NodeAttrs &attrs() const noexcept { return attributes; }
    NodeAttrs &attrs() noexcept { return attributes; }
    bool isTextblock() const noexcept { return isTextblockType(nodeType); }
    bool isLeaf() const noexcept { return isLeafType(nodeType); }

    const std::vector<Node> &children() const noexcept { return childNodes; }
    std::size_t childCount() const noexcept { return childNodes.size(); }
    const Node &child(std::size_t index) const;
    Node &child(std::size_t index);
    void appendChild(Node node);
    void insertChild(std::size_t index, Node node);
    void removeChild(std::size_t index);
    void replaceChildren(std::vector<Node> nodes);

    const std::vector<TextRun> &runs() const noexcept { return textRuns; }
    // Appends a run, merging it into the last run when the marks are equal.
    void appendRun(TextRun run);
    void appendRun(std::string text, MarkSet marks = {});
    void appendRuns(const std::vector<TextRun> &runs);

    std::size_t nodeSize() const noexcept;
    std::size_t contentSize() const noexcept;
    std::string textContent() const;
    std::string textBetween(std::size_t from, std::size_t to) const;

    void insertText(std::size_t pos, std::string_view text);
    void deleteText(std::size_t from, std::size_t to);

    bool operator==(const Node &other) const noexcept;
    bool operator!=(const Node &other) const noexcept { return !(*this == other); }
    // Equality that ignores block-group, image-source and rule-source attributes.
    bool sameStructure(const Node &other) const noexcept;

private:
    void appendTextBetween(std::size_t from, std::size_t to, std::string &out) const;
    Node &textblockAt(std::size_t pos, std::size_t &localPos);

    NodeType nodeType;
    NodeAttrs attributes;
    std::vector<Node> childNodes;
    std::vector<TextRun> textRuns;
};

struct ResolvedTextblock
{
    const Node *node = nullptr;
    std::size_t contentStart = 0;
    std::size_t contentEnd = 0;
};

// Innermost textblock whose content range [contentStart, contentEnd]
// contains pos, in the content coordinates of root.
std::optional<ResolvedTextblock> resolveTextblock(const Node &root, std::size_t pos);

using TextblockVisitor = std::function<void(const Node &textblock, std::size_t contentStart)>;
void forEachTextblock(const Node &root, const TextblockVisitor &visitor);

} // namespace mk::edit
