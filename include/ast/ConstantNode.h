#ifndef CONSTANT_NODE_H
#define CONSTANT_NODE_H

#include "Node.h"

namespace AST
{
    class ConstantNode : public Node
    {
    public:
        ConstantNode(const std::string &n) { this->Node::name = n; }
        NodeType getType() const override { return CONSTANT; }
    };
}

#endif // CONSTANT_NODE_H
