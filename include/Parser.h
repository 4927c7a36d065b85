#ifndef PARSER_H
#define PARSER_H

#include <string>
#include "AllNodes.h"

// bison/flex 生成的解析器使用全局状态，不可重入
extern AST::Node *fol_parse_result;
extern std::string fol_parse_error;

int yyparse(void);

void fol_scan_begin(const std::string &text);
void fol_scan_end();

#endif // PARSER_H
