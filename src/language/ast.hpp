#pragma once
#include "token.hpp"
#include <memory>
#include <string>
#include <vector>

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

struct Expr {
    enum class Kind {
        Number, String, Bool, Nil, List,
        Variable, Assign, IndexAssign,
        Unary, Binary, Logical,
        Call, Index,
    };

    Kind kind;
    int line{0};
    int column{0};

    double number{0.0};
    bool boolean{false};
    std::string name;            // Variable / Assign target, String literal
    TokenType op{TokenType::END_OF_FILE};

    // Unary: right. Binary/Logical: left op right. Assign: right = value.
    // Index: left[right]. IndexAssign: left[right] = args[0]. Call: left(args).
    ExprPtr left;
    ExprPtr right;
    std::vector<ExprPtr> args;   // call arguments, list elements

    Expr(Kind k, int l, int c) : kind(k), line(l), column(c) {}
};

struct Stmt {
    enum class Kind {
        Expression, Print, Let, Block,
        If, While, For, Function,
        Return, Break, Continue,
    };

    Kind kind;
    int line{0};
    int column{0};

    std::string name;                 // Let / Function
    std::vector<std::string> params;  // Function
    ExprPtr expr;                     // Expression, Let initializer, If/While/For condition, Return value
    ExprPtr step;                     // For increment
    std::vector<ExprPtr> args;        // Print arguments
    std::vector<StmtPtr> body;        // Block / Function body
    StmtPtr init;                     // For initializer
    StmtPtr then_branch;              // If, While/For body
    StmtPtr else_branch;              // If

    Stmt(Kind k, int l, int c) : kind(k), line(l), column(c) {}
};

struct Program {
    std::vector<StmtPtr> statements;
};
