#ifndef UNARY_OP_NODE_H
#define UNARY_OP_NODE_H

#include "Node.h"

namespace AST
{
    class UnaryOpNode : public Node
    {
    public:
        Node *child;
        Node::NodeType op;

        UnaryOpNode(Node::NodeType op, Node *child) : child(child), op(op) { this->name = this->child->name; }
        std::string toString() const override;
        NodeType getType() const override { return this->op; }
        ~UnaryOpNode();
    };
}

#endif // UNARY_OP_NODE_H
