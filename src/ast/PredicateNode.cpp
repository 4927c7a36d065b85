#include "PredicateNode.h"

bool AST::PredicateNode::insert(AST::Node *term)
{
    if (this->termlists == nullptr)
    {
        this->termlists = new TermListNode();
    }
    return this->termlists->insert(term);
}

std::string AST::PredicateNode::toString() const
{
    if (this->termlists == nullptr)
    {
        return this->Node::name;
    }
    return this->Node::name + "(" + this->termlists->toString() + ")";
}

AST::PredicateNode::~PredicateNode()
{
    delete this->termlists;
}
