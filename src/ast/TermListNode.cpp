#include "TermListNode.h"

bool AST::TermListNode::insert(AST::Node *term)
{
    for (const auto node : this->arguments)
    {
        if (term == node)
        {
            // 同一个节点不能挂两次，否则析构时会重复释放
            return false;
        }
    }
    this->arguments.push_back(term);
    return true;
}

std::string AST::TermListNode::toString() const
{
    std::string result;
    for (size_t i = 0; i < this->arguments.size(); ++i)
    {
        result += this->arguments[i]->toString();
        if (i < this->arguments.size() - 1)
        {
            result += ",";
        }
    }
    return result;
}

AST::TermListNode::~TermListNode()
{
    for (Node *node : this->arguments)
    {
        delete node;
    }
    arguments.clear();
}
