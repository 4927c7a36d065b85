#ifndef FUNCTION_NODE_H
#define FUNCTION_NODE_H

#include "Node.h"
#include "TermListNode.h"

namespace AST
{
    // 函数项 f(t1, ..., tn)，只出现在参数位置
    class FunctionNode : public Node
    {
    public:
        TermListNode *termlists;
        FunctionNode() : termlists(nullptr) {}
        FunctionNode(const std::string &functionName, TermListNode *term_lists) : termlists(term_lists) { this->Node::name = functionName; }
        bool insert(Node *term) override; // add function arity in this->termlists
        std::string toString() const override;
        NodeType getType() const override { return FUNCTION; }
        ~FunctionNode();
    };
}

#endif // FUNCTION_NODE_H
