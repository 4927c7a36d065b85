#ifndef ALL_NODES_H
#define ALL_NODES_H

#include "Node.h"
#include "TermListNode.h"
#include "FunctionNode.h"
#include "PredicateNode.h"
#include "UnaryOpNode.h"
#include "VariableNode.h"
#include "ConstantNode.h"

#endif // ALL_NODES_H
