#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <sandpit/source/span.h>
#include <string>
#include <variant>
#include <vector>

/**
 * @file ast.h
 * @brief Abstract syntax tree (AST) for the supported Python subset.
 *
 * Nodes own their names and decoded literal text, so a Program does not depend on the
 * lifetime of the source buffer. Function values created at runtime point back into the
 * Program, which must therefore outlive any interpreter run over it.
 */

namespace sandpit::parser
{

struct Expr;
struct Block;

using ExprPtr = std::unique_ptr<Expr>;

/** @brief `None` literal. */
struct NoneExpr
{
};

/** @brief `True` / `False` literal. */
struct BoolExpr
{
    bool value = false;
};

/** @brief Integer literal (already converted, fits in 64 bits). */
struct IntExpr
{
    std::int64_t value = 0;
};

/** @brief Float literal. */
struct FloatExpr
{
    double value = 0.0;
};

/** @brief String literal with escapes decoded; adjacent literals are merged. */
struct StringExpr
{
    std::string value;
};

/**
 * @brief One piece of an f-string: literal text, or a replacement field when `expr` is set.
 *
 * `conversion` is `'r'`, `'s'` or `'\0'`; `format_spec` is the literal text after `:`.
 */
struct FStringPart
{
    std::string literal;
    ExprPtr expr;
    char conversion = '\0';
    std::string format_spec;
};

/** @brief Formatted string literal. */
struct FStringExpr
{
    std::vector<FStringPart> parts;
};

/** @brief Identifier reference. */
struct NameExpr
{
    std::string name;
};

enum class UnaryOp
{
    Neg,
    Pos,
    Not,
    Invert,
};

struct UnaryExpr
{
    UnaryOp op = UnaryOp::Neg;
    ExprPtr operand;
};

enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    FloorDiv,
    Mod,
    Pow,
    BitAnd,
    BitOr,
    BitXor,
    LShift,
    RShift,
};

struct BinaryExpr
{
    BinaryOp op = BinaryOp::Add;
    ExprPtr lhs;
    ExprPtr rhs;
};

enum class BoolOp
{
    And,
    Or,
};

/** @brief Short-circuiting `and` / `or`. */
struct BoolOpExpr
{
    BoolOp op = BoolOp::And;
    ExprPtr lhs;
    ExprPtr rhs;
};

enum class CompareOp
{
    Eq,
    NotEq,
    Lt,
    LtE,
    Gt,
    GtE,
    In,
    NotIn,
    Is,
    IsNot,
};

struct CompareLink
{
    CompareOp op = CompareOp::Eq;
    ExprPtr rhs;
};

/** @brief Possibly chained comparison: `a < b <= c`. */
struct CompareExpr
{
    ExprPtr first;
    std::vector<CompareLink> links;
};

/** @brief Conditional expression: `then_value if cond else else_value`. */
struct IfExpr
{
    ExprPtr cond;
    ExprPtr then_value;
    ExprPtr else_value;
};

/** @brief Call argument: positional, `name=value`, or `*iterable`. */
struct Argument
{
    sandpit::source::Span span;
    std::optional<std::string> keyword;
    bool star = false;
    ExprPtr value;
};

struct CallExpr
{
    ExprPtr callee;
    std::vector<Argument> args;
};

/** @brief Attribute access `base.name` (only methods of builtin types resolve). */
struct AttributeExpr
{
    ExprPtr base;
    std::string name;
};

struct SubscriptExpr
{
    ExprPtr base;
    ExprPtr index;
};

/** @brief Slice inside a subscript; absent bounds are null. */
struct SliceExpr
{
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

/** @brief `*value` inside a display or an assignment target list. */
struct StarredExpr
{
    ExprPtr value;
};

struct ListExpr
{
    std::vector<Expr> elements;
};

struct TupleExpr
{
    std::vector<Expr> elements;
};

struct SetExpr
{
    std::vector<Expr> elements;
};

struct DictExpr
{
    std::vector<Expr> keys;
    std::vector<Expr> values;
};

/** @brief One `for target in iter [if cond]...` clause of a comprehension. */
struct CompFor
{
    ExprPtr target;
    ExprPtr iter;
    std::vector<Expr> conditions;
};

enum class ComprehensionKind
{
    List,
    Set,
    Dict,
    Generator,
};

/** @brief List/set/dict comprehension or generator expression. `value` is set for dicts. */
struct ComprehensionExpr
{
    ComprehensionKind kind = ComprehensionKind::List;
    ExprPtr element;
    ExprPtr value;
    std::vector<CompFor> clauses;
};

/** @brief Function parameter with optional default value. */
struct Param
{
    sandpit::source::Span span;
    std::string name;
    ExprPtr default_value;
};

struct LambdaExpr
{
    std::vector<Param> params;
    ExprPtr body;
};

/** @brief A general expression node with span and variant payload. */
struct Expr
{
    sandpit::source::Span span;
    std::variant<NoneExpr, BoolExpr, IntExpr, FloatExpr, StringExpr, FStringExpr, NameExpr,
                 UnaryExpr, BinaryExpr, BoolOpExpr, CompareExpr, IfExpr, CallExpr, AttributeExpr,
                 SubscriptExpr, SliceExpr, StarredExpr, ListExpr, TupleExpr, SetExpr, DictExpr,
                 ComprehensionExpr, LambdaExpr>
        node;
};

struct ExprStmt
{
    Expr expr;
};

/** @brief `t1 = t2 = value`; each target may be a name, attribute, subscript or tuple/list. */
struct AssignStmt
{
    std::vector<Expr> targets;
    Expr value;
};

struct AugAssignStmt
{
    Expr target;
    BinaryOp op = BinaryOp::Add;
    Expr value;
};

/** @brief If statement; `elif` chains are nested IfStmts inside `else_block`. */
struct IfStmt
{
    Expr cond;
    std::unique_ptr<Block> then_block;
    std::unique_ptr<Block> else_block;
};

struct WhileStmt
{
    Expr cond;
    std::unique_ptr<Block> body;
    std::unique_ptr<Block> else_block;
};

struct ForStmt
{
    Expr target;
    Expr iter;
    std::unique_ptr<Block> body;
    std::unique_ptr<Block> else_block;
};

struct BreakStmt
{
};

struct ContinueStmt
{
};

struct PassStmt
{
};

struct ReturnStmt
{
    std::optional<Expr> value;
};

struct FunctionDef
{
    std::string name;
    std::vector<Param> params;
    std::unique_ptr<Block> body;
};

struct GlobalStmt
{
    std::vector<std::string> names;
};

struct NonlocalStmt
{
    std::vector<std::string> names;
};

struct DelStmt
{
    std::vector<Expr> targets;
};

struct AssertStmt
{
    Expr test;
    std::optional<Expr> message;
};

/** @brief General statement node with span and variant payload. */
struct Stmt
{
    sandpit::source::Span span;
    std::variant<ExprStmt, AssignStmt, AugAssignStmt, IfStmt, WhileStmt, ForStmt, BreakStmt,
                 ContinueStmt, PassStmt, ReturnStmt, FunctionDef, GlobalStmt, NonlocalStmt,
                 DelStmt, AssertStmt>
        node;
};

/** @brief A sequence of statements with a source span. */
struct Block
{
    sandpit::source::Span span;
    std::vector<Stmt> stmts;
};

/** @brief A parsed script: the top-level statement list. */
struct Program
{
    std::vector<Stmt> body;
};

} // namespace sandpit::parser
