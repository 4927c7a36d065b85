#include "UnaryOpNode.h"

std::string AST::UnaryOpNode::toString() const
{
    if (this->op == NOT)
    {
        return "¬" + this->child->toString();
    }
    return this->child->toString();
}

AST::UnaryOpNode::~UnaryOpNode()
{
    delete this->child;
}
