#pragma once

#include "mk/edit/document.hpp"
#include "mk/edit/markdown_parser.hpp"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

class BlockIdGenerator
{
public:
    virtual ~BlockIdGenerator() = default;
    virtual std::string next(BlockGroupKind kind) = 0;
};

// Ids of the form <prefix>_<milliseconds>_<9 base-36 characters>, with the
// prefix cb, tb, hb or mb by block kind.
class RandomBlockIdGenerator : public BlockIdGenerator
{
public:
    RandomBlockIdGenerator();
    std::string next(BlockGroupKind kind) override;

private:
    std::mt19937_64 engine;
};

std::string_view blockGroupPrefix(BlockGroupKind kind) noexcept;

// Rewrites a whole tree between the structured form produced by the parser
// and the source-view form, where code blocks, tables, HTML blocks and math
// blocks become one paragraph per source line and images and horizontal
// rules become one paragraph holding their Markdown.
//
// toStructured never fails: a group whose joined text no longer matches its
// block grammar stays as plain paragraphs.
class SourceViewTransform
{
public:
    SourceViewTransform();
    explicit SourceViewTransform(std::shared_ptr<BlockIdGenerator> ids);

    Node toFlattened(const Node &doc) const;
    Node toStructured(const Node &doc) const;

    static bool containsStructuredBlocks(const Node &doc);

    static std::vector<std::string> codeBlockLines(const Node &codeBlock);
    static std::vector<std::string> tableLines(const Node &table);
    static std::vector<std::string> mathBlockLines(const Node &mathBlock);

private:
    std::vector<Node> flattenNode(const Node &node) const;
    std::vector<Node> groupParagraphs(BlockGroupKind kind, const std::vector<std::string> &lines) const;
    Node structureNode(const Node &node) const;
    std::optional<Node> rebuildGroup(BlockGroupKind kind, const std::vector<Node> &paragraphs) const;
    std::optional<Node> rebuildSingle(const Node &paragraph) const;

    std::shared_ptr<BlockIdGenerator> idGenerator;
    MarkdownParser parser;
};

} // namespace mk::edit
