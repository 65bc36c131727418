#pragma once

#include "style/AttributeSet.hpp"
#include <memory>
#include <string>
#include <vector>

namespace thermo::style {

/**
 * A node of a styled text tree: either a Text leaf or a Group that applies
 * a style to its children.
 *
 * Nodes are immutable and share their subtrees, so copying a node is O(1)
 * and building a larger tree never changes the smaller ones it was built
 * from. Every builder returns a new node.
 *
 * Example:
 *   auto line = StyledNode("Total ").bold().append(StyledNode("$25.00").underlined());
 *   printer.println(line);
 */
class StyledNode {
public:
    // Plain strings convert implicitly to Text leaves
    StyledNode(std::string content);
    StyledNode(const char* content);

    static StyledNode text(std::string content);
    static StyledNode group(AttributeSet style, std::vector<StyledNode> children);

    // Group(style, [*this])
    StyledNode with_style(const AttributeSet& style) const;

    StyledNode bold() const;
    StyledNode underlined() const;
    StyledNode double_underlined() const;
    StyledNode reversed() const;
    StyledNode double_strike() const;
    StyledNode upside_down() const;
    StyledNode rotated() const;

    // Group(default, [*this, other]); siblings never see each other's style
    StyledNode append(const StyledNode& other) const;

    bool is_text() const;
    // Text content; empty for groups
    const std::string& content() const;
    // Group style; baseline for text
    const AttributeSet& style() const;
    // Group children; empty for text
    const std::vector<StyledNode>& children() const;

    /**
     * Render to printer bytes: literal text interleaved with the minimal
     * style transitions, ending with the device back at the baseline style.
     */
    std::string render() const;

    // render() followed by a line feed
    std::string render_line() const;

    bool operator==(const StyledNode& other) const;

private:
    struct Node;
    explicit StyledNode(std::shared_ptr<const Node> node);

    std::shared_ptr<const Node> node_;
};

}  // namespace thermo::style
