#include "style/StyledNode.hpp"
#include "style/Transition.hpp"
#include "command/Character.hpp"
#include <utility>

namespace thermo::style {

struct StyledNode::Node {
    bool is_text = true;
    std::string content;
    AttributeSet style;
    std::vector<StyledNode> children;
};

namespace {

const std::string EMPTY_CONTENT;
const std::vector<StyledNode> NO_CHILDREN;

/**
 * Depth-first walk keeping the stack of open scopes.
 *
 * The stack starts with a baseline sentinel so that combine() over it is
 * always well defined, and is back to exactly that sentinel once the walk
 * returns.
 */
class StyleRenderer {
public:
    std::string run(const StyledNode& root) {
        output_.clear();
        stack_.assign(1, AttributeSet{});
        current_ = AttributeSet{};

        visit(root);

        // No-op unless the walk left residual state
        transition_to(AttributeSet{});
        return std::move(output_);
    }

private:
    std::string output_;
    std::vector<AttributeSet> stack_;
    AttributeSet current_;

    void transition_to(const AttributeSet& next) {
        output_ += command::encode(style_transition_commands(current_, next));
        current_ = next;
    }

    void visit(const StyledNode& node) {
        if (node.is_text()) {
            output_ += node.content();
            return;
        }

        stack_.push_back(node.style());
        transition_to(AttributeSet::combine(stack_));

        for (const auto& child : node.children()) {
            visit(child);
        }

        stack_.pop_back();
        transition_to(AttributeSet::combine(stack_));
    }
};

}  // namespace

StyledNode::StyledNode(std::string content)
    : node_(std::make_shared<const Node>(Node{true, std::move(content), {}, {}})) {}

StyledNode::StyledNode(const char* content)
    : StyledNode(std::string(content ? content : "")) {}

StyledNode::StyledNode(std::shared_ptr<const Node> node)
    : node_(std::move(node)) {}

StyledNode StyledNode::text(std::string content) {
    return StyledNode(std::move(content));
}

StyledNode StyledNode::group(AttributeSet style, std::vector<StyledNode> children) {
    return StyledNode(std::make_shared<const Node>(Node{false, {}, style, std::move(children)}));
}

StyledNode StyledNode::with_style(const AttributeSet& style) const {
    return group(style, {*this});
}

StyledNode StyledNode::bold() const {
    return with_style(AttributeSet{}.with_bold(true));
}

StyledNode StyledNode::underlined() const {
    return with_style(AttributeSet{}.with_underline(Underline::Single));
}

StyledNode StyledNode::double_underlined() const {
    return with_style(AttributeSet{}.with_underline(Underline::Double));
}

StyledNode StyledNode::reversed() const {
    return with_style(AttributeSet{}.with_reverse(true));
}

StyledNode StyledNode::double_strike() const {
    return with_style(AttributeSet{}.with_double_strike(true));
}

StyledNode StyledNode::upside_down() const {
    return with_style(AttributeSet{}.with_upside_down(true));
}

StyledNode StyledNode::rotated() const {
    return with_style(AttributeSet{}.with_rotated(true));
}

StyledNode StyledNode::append(const StyledNode& other) const {
    // Always a neutral wrapper, even when the two styles already differ
    return group(AttributeSet{}, {*this, other});
}

bool StyledNode::is_text() const {
    return node_->is_text;
}

const std::string& StyledNode::content() const {
    return node_->is_text ? node_->content : EMPTY_CONTENT;
}

const AttributeSet& StyledNode::style() const {
    return node_->style;
}

const std::vector<StyledNode>& StyledNode::children() const {
    return node_->is_text ? NO_CHILDREN : node_->children;
}

std::string StyledNode::render() const {
    StyleRenderer renderer;
    return renderer.run(*this);
}

std::string StyledNode::render_line() const {
    return render() + command::line_feed();
}

bool StyledNode::operator==(const StyledNode& other) const {
    if (node_ == other.node_) return true;
    return node_->is_text == other.node_->is_text &&
           node_->content == other.node_->content &&
           node_->style == other.node_->style &&
           node_->children == other.node_->children;
}

}  // namespace thermo::style
