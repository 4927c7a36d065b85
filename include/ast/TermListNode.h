#ifndef TERMLIST_NODE_H
#define TERMLIST_NODE_H

#include "Node.h"

namespace AST
{
    class TermListNode : public Node
    {
    public:
        std::vector<Node *> arguments; // Arguments could be vars, constants, functions

        TermListNode() {}
        bool insert(Node *term) override;
        std::string toString() const override;
        NodeType getType() const override { return TERMLIST; }
        ~TermListNode();
    };
}

#endif // TERMLIST_NODE_H
