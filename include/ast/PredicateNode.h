#ifndef PREDICATE_NODE_H
#define PREDICATE_NODE_H

#include "Node.h"
#include "TermListNode.h"

namespace AST
{
    // 文字最外层的谓词 P(t1, ..., tn)
    class PredicateNode : public Node
    {
    public:
        TermListNode *termlists;
        PredicateNode() : termlists(nullptr) {}
        PredicateNode(const std::string &n, TermListNode *term_lists) : termlists(term_lists) { this->Node::name = n; }
        bool insert(Node *term) override;
        std::string toString() const override;
        NodeType getType() const override { return PREDICATE; }
        ~PredicateNode();
    };
}

#endif // PREDICATE_NODE_H
