#include "FunctionNode.h"

bool AST::FunctionNode::insert(AST::Node *term)
{
    if (this->termlists == nullptr)
    {
        this->termlists = new TermListNode();
    }
    return this->termlists->insert(term);
}

std::string AST::FunctionNode::toString() const
{
    if (this->termlists == nullptr)
    {
        return this->Node::name;
    }
    return this->Node::name + "(" + this->termlists->toString() + ")";
}

AST::FunctionNode::~FunctionNode()
{
    delete this->termlists;
}
