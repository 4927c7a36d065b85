#ifndef NODE_H
#define NODE_H

#include <string>
#include <vector>

namespace AST
{
    class Node
    {
    public:
        enum NodeType
        {
            PREDICATE,
            FUNCTION,
            VARIABLE,
            CONSTANT,
            TERMLIST,
            NOT
        };
        std::string name; //节点名字
        virtual NodeType getType() const = 0;
        virtual std::string toString() const { return name; }
        virtual bool insert(Node *term) { return false; } // insert arguments
        virtual ~Node() {} // Virtual destructor for proper cleanup
    };
}

#endif // NODE_H
