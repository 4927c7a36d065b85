#include <gtest/gtest.h>
#include <memory>
#include "KnowledgeBase.h"
#include "KnowledgeBaseBuilder.h"
#include "Parser.h"

namespace ProofEngine
{
    class ParserTest : public ::testing::Test
    {
    protected:
        KnowledgeBase kb;

        Literal parse(const std::string &text)
        {
            return KnowledgeBaseBuilder::parseLiteral(text, kb);
        }
    };

    TEST_F(ParserTest, CompoundLiteral)
    {
        Literal lit = parse("Parent(x,y)");
        EXPECT_FALSE(lit.isNegated());

        const Term &atom = lit.getAtom();
        ASSERT_TRUE(atom.isCompound());
        EXPECT_EQ(kb.getFunctorName(atom.getHead().id), "Parent");
        ASSERT_EQ(atom.arity(), 2);
        EXPECT_TRUE(atom.getArguments()[0].isVariable());
        EXPECT_TRUE(atom.getArguments()[1].isVariable());
        EXPECT_EQ(lit.toString(kb), "Parent(x,y)");
    }

    TEST_F(ParserTest, NestedFunctionAndWhitespace)
    {
        Literal lit = parse("  ¬ Loves( father(x) , John ) ");
        EXPECT_TRUE(lit.isNegated());

        const Term &atom = lit.getAtom();
        ASSERT_EQ(atom.arity(), 2);
        EXPECT_TRUE(atom.getArguments()[0].isCompound());
        EXPECT_TRUE(atom.getArguments()[1].isConstant());
        EXPECT_EQ(lit.toString(kb), "¬Loves(father(x),John)");
    }

    TEST_F(ParserTest, WhitespaceDoesNotChangeLiteral)
    {
        EXPECT_EQ(parse("P(a, b)"), parse("P(a,b)"));
        EXPECT_EQ(parse("¬P(a)"), parse("~P( a )"));
        EXPECT_EQ(parse("!P(a)"), parse("¬P(a)"));
    }

    TEST_F(ParserTest, AtomicLiterals)
    {
        Literal constant = parse("A");
        EXPECT_TRUE(constant.getAtom().isConstant());

        Literal negated = parse("¬A");
        EXPECT_TRUE(negated.isNegated());
        EXPECT_EQ(negated.complement(), constant);

        // 原子位置上的小写字母也是命题常量，不是变量
        Literal lower = parse("p");
        EXPECT_TRUE(lower.getAtom().isConstant());
        EXPECT_FALSE(kb.isVariable(kb.getSymbolId("p").value()));
    }

    TEST_F(ParserTest, VariableNamingConvention)
    {
        Literal lit = parse("P(x, x_1, xy, John, f(a))");
        const auto &args = lit.getAtom().getArguments();
        ASSERT_EQ(args.size(), 5);
        EXPECT_TRUE(args[0].isVariable());
        EXPECT_TRUE(args[1].isVariable());
        EXPECT_TRUE(args[2].isConstant());
        EXPECT_TRUE(args[3].isConstant());
        EXPECT_TRUE(args[4].isCompound());
        // a 在参数位置同样是变量
        EXPECT_TRUE(args[4].getArguments()[0].isVariable());
    }

    TEST_F(ParserTest, MalformedLiteralsThrow)
    {
        EXPECT_THROW(parse("P(a"), ParseError);
        EXPECT_THROW(parse("P(a))"), ParseError);
        EXPECT_THROW(parse("P()"), ParseError);
        EXPECT_THROW(parse("P(a,)"), ParseError);
        EXPECT_THROW(parse("P(,a)"), ParseError);
        EXPECT_THROW(parse("P(a) Q"), ParseError);
        EXPECT_THROW(parse("P(a;b)"), ParseError);
        EXPECT_THROW(parse("¬¬P(a)"), ParseError);
        EXPECT_THROW(parse(""), ParseError);
    }

    TEST_F(ParserTest, ParseErrorCarriesInput)
    {
        try
        {
            parse("Q(a");
            FAIL() << "expected ParseError";
        }
        catch (const ParseError &e)
        {
            EXPECT_EQ(e.getInput(), "Q(a");
            EXPECT_NE(std::string(e.what()).find("Q(a"), std::string::npos);
        }
    }

    TEST_F(ParserTest, RecoversAfterError)
    {
        EXPECT_THROW(parse("P(a"), ParseError);
        Literal lit = parse("P(b)");
        EXPECT_EQ(lit.toString(kb), "P(b)");
    }

    TEST_F(ParserTest, GrammarBuildsAst)
    {
        fol_parse_result = nullptr;
        fol_scan_begin("~Loves(father(x), x)");
        int status = yyparse();
        fol_scan_end();

        ASSERT_EQ(status, 0);
        std::unique_ptr<AST::Node> root(fol_parse_result);
        fol_parse_result = nullptr;
        ASSERT_TRUE(root);
        EXPECT_EQ(root->getType(), AST::Node::NOT);

        auto *notNode = static_cast<AST::UnaryOpNode *>(root.get());
        EXPECT_EQ(notNode->child->getType(), AST::Node::PREDICATE);
        EXPECT_EQ(root->toString(), "¬Loves(father(x),x)");
    }
}
