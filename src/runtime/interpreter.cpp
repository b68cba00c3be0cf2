#include <functional>
#include <memory>
#include <new>
#include <sandpit/parser/parser.h>
#include <sandpit/runtime/call.h>
#include <sandpit/runtime/error.h>
#include <sandpit/runtime/interpreter.h>
#include <sandpit/runtime/methods.h>
#include <sandpit/runtime/namespace.h>
#include <sandpit/runtime/operations.h>
#include <sandpit/runtime/value.h>
#include <sandpit/source/line_map.h>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace sandpit::runtime
{

using namespace sandpit::parser;
using sandpit::source::Span;

/** @brief Names a function (or comprehension) binds locally, plus its declarations. */
struct LocalInfo
{
    std::unordered_set<std::string> locals;
    std::unordered_set<std::string> globals;
    std::unordered_set<std::string> nonlocals;
};

/** @brief One activation: module globals (info == nullptr), a call or a comprehension. */
struct Scope
{
    std::unordered_map<std::string, Value> vars;
    std::shared_ptr<Scope> parent;
    const LocalInfo* info = nullptr;
};

namespace
{

enum class Flow
{
    Normal,
    Break,
    Continue,
    Return,
};

void collect_target_names(const Expr& target, std::unordered_set<std::string>& out)
{
    if (const auto* name = std::get_if<NameExpr>(&target.node))
    {
        out.insert(name->name);
    }
    else if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
    {
        for (const auto& e : tuple->elements)
        {
            collect_target_names(e, out);
        }
    }
    else if (const auto* list = std::get_if<ListExpr>(&target.node))
    {
        for (const auto& e : list->elements)
        {
            collect_target_names(e, out);
        }
    }
    else if (const auto* starred = std::get_if<StarredExpr>(&target.node))
    {
        collect_target_names(*starred->value, out);
    }
}

// Nested defs, lambdas and comprehensions get their own LocalInfo and are not entered.
void collect_block(const Block& block, LocalInfo& info)
{
    for (const auto& stmt : block.stmts)
    {
        std::visit(
            [&](const auto& node)
            {
                using Node = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<Node, AssignStmt>)
                {
                    for (const auto& t : node.targets)
                    {
                        collect_target_names(t, info.locals);
                    }
                }
                else if constexpr (std::is_same_v<Node, AugAssignStmt>)
                {
                    collect_target_names(node.target, info.locals);
                }
                else if constexpr (std::is_same_v<Node, ForStmt>)
                {
                    collect_target_names(node.target, info.locals);
                    collect_block(*node.body, info);
                    if (node.else_block)
                    {
                        collect_block(*node.else_block, info);
                    }
                }
                else if constexpr (std::is_same_v<Node, WhileStmt>)
                {
                    collect_block(*node.body, info);
                    if (node.else_block)
                    {
                        collect_block(*node.else_block, info);
                    }
                }
                else if constexpr (std::is_same_v<Node, IfStmt>)
                {
                    collect_block(*node.then_block, info);
                    if (node.else_block)
                    {
                        collect_block(*node.else_block, info);
                    }
                }
                else if constexpr (std::is_same_v<Node, FunctionDef>)
                {
                    info.locals.insert(node.name);
                }
                else if constexpr (std::is_same_v<Node, DelStmt>)
                {
                    for (const auto& t : node.targets)
                    {
                        collect_target_names(t, info.locals);
                    }
                }
                else if constexpr (std::is_same_v<Node, GlobalStmt>)
                {
                    info.globals.insert(node.names.begin(), node.names.end());
                }
                else if constexpr (std::is_same_v<Node, NonlocalStmt>)
                {
                    info.nonlocals.insert(node.names.begin(), node.names.end());
                }
            },
            stmt.node);
    }
}

std::unique_ptr<LocalInfo> function_locals(const std::vector<Param>& params, const Block* body)
{
    auto info = std::make_unique<LocalInfo>();
    for (const auto& p : params)
    {
        info->locals.insert(p.name);
    }
    if (body != nullptr)
    {
        collect_block(*body, *info);
    }
    for (const auto& name : info->globals)
    {
        info->locals.erase(name);
    }
    for (const auto& name : info->nonlocals)
    {
        info->locals.erase(name);
    }
    return info;
}

/** @brief Statically misplaced statements Python rejects at compile time. */
class StructureChecker
{
  public:
    void check_program(const Program& program)
    {
        for (const auto& stmt : program.body)
        {
            check_stmt(stmt, false, false);
        }
    }

  private:
    void check_block(const Block& block, bool in_function, bool in_loop)
    {
        for (const auto& stmt : block.stmts)
        {
            check_stmt(stmt, in_function, in_loop);
        }
    }

    [[noreturn]] static void syntax_error(const Stmt& stmt, std::string message)
    {
        ScriptError error("SyntaxError", std::move(message));
        error.span = stmt.span;
        throw error;
    }

    void check_stmt(const Stmt& stmt, bool in_function, bool in_loop)
    {
        std::visit(
            [&](const auto& node)
            {
                using Node = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<Node, ReturnStmt>)
                {
                    if (!in_function)
                    {
                        syntax_error(stmt, "'return' outside function");
                    }
                }
                else if constexpr (std::is_same_v<Node, BreakStmt>)
                {
                    if (!in_loop)
                    {
                        syntax_error(stmt, "'break' outside loop");
                    }
                }
                else if constexpr (std::is_same_v<Node, ContinueStmt>)
                {
                    if (!in_loop)
                    {
                        syntax_error(stmt, "'continue' not properly in loop");
                    }
                }
                else if constexpr (std::is_same_v<Node, NonlocalStmt>)
                {
                    if (!in_function)
                    {
                        syntax_error(stmt, "nonlocal declaration not allowed at module level");
                    }
                }
                else if constexpr (std::is_same_v<Node, FunctionDef>)
                {
                    check_block(*node.body, true, false);
                }
                else if constexpr (std::is_same_v<Node, IfStmt>)
                {
                    check_block(*node.then_block, in_function, in_loop);
                    if (node.else_block)
                    {
                        check_block(*node.else_block, in_function, in_loop);
                    }
                }
                else if constexpr (std::is_same_v<Node, WhileStmt> || std::is_same_v<Node, ForStmt>)
                {
                    check_block(*node.body, in_function, true);
                    if (node.else_block)
                    {
                        check_block(*node.else_block, in_function, in_loop);
                    }
                }
            },
            stmt.node);
    }
};

std::string plural(std::size_t n, std::string_view word)
{
    return std::to_string(n) + " " + std::string(word) + (n == 1 ? "" : "s");
}

// "'a'", "'a' and 'b'", "'a', 'b', and 'c'"
std::string quoted_list(const std::vector<std::string>& names)
{
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
        {
            out += names.size() == 2 ? " and " : (i + 1 == names.size() ? ", and " : ", ");
        }
        out += "'" + names[i] + "'";
    }
    return out;
}

class Interpreter final : public CallContext
{
  public:
    explicit Interpreter(const RunOptions& options)
        : options_(options), output_(options.max_output_bytes),
          builtins_(restricted_namespace()), globals_(std::make_shared<Scope>()), scope_(globals_)
    {
    }

    ~Interpreter() override
    {
        // Functions hold their defining scope, which usually holds the function: clear the
        // variables to break those cycles.
        for (const auto& weak : captured_)
        {
            if (auto scope = weak.lock())
            {
                scope->vars.clear();
            }
        }
        globals_->vars.clear();
    }

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void run(const Program& program)
    {
        StructureChecker{}.check_program(program);
        for (const auto& stmt : program.body)
        {
            (void)exec_stmt(stmt);
        }
    }

    OutputBuffer& output() { return output_; }

    Value call(const Value& callee, CallArgs args) override
    {
        switch (callee.kind())
        {
        case ValueKind::Builtin:
            return callee.as_builtin()->fn(*this, args);
        case ValueKind::BoundMethod:
        {
            const auto& method = callee.as_bound_method();
            return call_method(*this, method.self, method.name, args);
        }
        case ValueKind::Function:
            return call_function(callee.as_function(), std::move(args));
        default:
            type_error("'" + type_name(callee) + "' object is not callable");
        }
    }

    void write(std::string_view text) override { output_.append(text); }

  private:
    const RunOptions& options_;
    OutputBuffer output_;
    const RestrictedNamespace& builtins_;
    std::shared_ptr<Scope> globals_;
    std::shared_ptr<Scope> scope_;
    Value return_value_;
    std::unordered_map<const void*, std::unique_ptr<LocalInfo>> local_info_;
    std::vector<std::weak_ptr<Scope>> captured_;

    // Scopes ------------------------------------------------------------------------------

    class ScopeSwap
    {
      public:
        ScopeSwap(std::shared_ptr<Scope>& slot, std::shared_ptr<Scope> next)
            : slot_(slot), saved_(std::exchange(slot, std::move(next)))
        {
        }
        ~ScopeSwap() { slot_ = std::move(saved_); }
        ScopeSwap(const ScopeSwap&) = delete;
        ScopeSwap& operator=(const ScopeSwap&) = delete;

      private:
        std::shared_ptr<Scope>& slot_;
        std::shared_ptr<Scope> saved_;
    };

    const LocalInfo* locals_for(const void* node, const std::vector<Param>& params,
                                const Block* body)
    {
        auto& slot = local_info_[node];
        if (!slot)
        {
            slot = function_locals(params, body);
        }
        return slot.get();
    }

    const LocalInfo* locals_for(const ComprehensionExpr& comp)
    {
        auto& slot = local_info_[&comp];
        if (!slot)
        {
            slot = std::make_unique<LocalInfo>();
            for (const auto& clause : comp.clauses)
            {
                collect_target_names(*clause.target, slot->locals);
            }
        }
        return slot.get();
    }

    Scope* nonlocal_scope(const std::string& name)
    {
        for (Scope* s = scope_->parent.get(); s != nullptr && s->info != nullptr;
             s = s->parent.get())
        {
            if (s->info->locals.contains(name))
            {
                return s;
            }
        }
        raise("SyntaxError", "no binding for nonlocal '" + name + "' found");
    }

    Value load_name(const std::string& name)
    {
        Scope* scope = scope_.get();
        while (scope->info != nullptr)
        {
            const LocalInfo& info = *scope->info;
            if (info.globals.contains(name))
            {
                scope = globals_.get();
                break;
            }
            if (info.locals.contains(name))
            {
                const auto it = scope->vars.find(name);
                if (it != scope->vars.end())
                {
                    return it->second;
                }
                if (scope == scope_.get())
                {
                    raise("UnboundLocalError", "cannot access local variable '" + name +
                                                   "' where it is not associated with a value");
                }
                raise("NameError", "cannot access free variable '" + name +
                                       "' where it is not associated with a value in "
                                       "enclosing scope");
            }
            scope = scope->parent.get();
        }
        const auto it = scope->vars.find(name);
        if (it != scope->vars.end())
        {
            return it->second;
        }
        if (const Builtin* builtin = builtins_.find(name))
        {
            return Value::builtin(builtin);
        }
        raise("NameError", "name '" + name + "' is not defined");
    }

    Scope* binding_scope(const std::string& name)
    {
        if (scope_->info != nullptr)
        {
            if (scope_->info->globals.contains(name))
            {
                return globals_.get();
            }
            if (scope_->info->nonlocals.contains(name))
            {
                return nonlocal_scope(name);
            }
        }
        return scope_.get();
    }

    void store_name(const std::string& name, Value value)
    {
        binding_scope(name)->vars.insert_or_assign(name, std::move(value));
    }

    void delete_name(const std::string& name)
    {
        Scope* scope = binding_scope(name);
        if (scope->vars.erase(name) == 0)
        {
            if (scope->info != nullptr && scope == scope_.get())
            {
                raise("UnboundLocalError", "cannot access local variable '" + name +
                                               "' where it is not associated with a value");
            }
            raise("NameError", "name '" + name + "' is not defined");
        }
    }

    // Calls -------------------------------------------------------------------------------

    void bind_arguments(const FunctionObject& fn, CallArgs& args, Scope& frame)
    {
        const auto& params = *fn.params;
        const std::string label = fn.name + "()";
        if (args.positional.size() > params.size())
        {
            std::size_t required = 0;
            for (const auto& d : fn.defaults)
            {
                required += d.has_value() ? 0 : 1;
            }
            const std::string takes =
                required == params.size()
                    ? plural(params.size(), "positional argument")
                    : "from " + std::to_string(required) + " to " +
                          plural(params.size(), "positional argument");
            const std::size_t given = args.positional.size();
            type_error(label + " takes " + takes + " but " + std::to_string(given) +
                       (given == 1 ? " was" : " were") + " given");
        }

        std::vector<bool> bound(params.size(), false);
        for (std::size_t i = 0; i < args.positional.size(); ++i)
        {
            frame.vars.insert_or_assign(params[i].name, std::move(args.positional[i]));
            bound[i] = true;
        }
        for (auto& [key, value] : args.keywords)
        {
            std::size_t i = 0;
            while (i < params.size() && params[i].name != key)
            {
                ++i;
            }
            if (i == params.size())
            {
                type_error(label + " got an unexpected keyword argument '" + key + "'");
            }
            if (bound[i])
            {
                type_error(label + " got multiple values for argument '" + key + "'");
            }
            frame.vars.insert_or_assign(key, std::move(value));
            bound[i] = true;
        }

        std::vector<std::string> missing;
        for (std::size_t i = 0; i < params.size(); ++i)
        {
            if (bound[i])
            {
                continue;
            }
            if (fn.defaults[i].has_value())
            {
                frame.vars.insert_or_assign(params[i].name, *fn.defaults[i]);
            }
            else
            {
                missing.push_back(params[i].name);
            }
        }
        if (!missing.empty())
        {
            type_error(label + " missing " +
                       plural(missing.size(), "required positional argument") + ": " +
                       quoted_list(missing));
        }
    }

    Value call_function(const std::shared_ptr<FunctionObject>& fn, CallArgs args)
    {
        RecursionGuard depth;
        auto frame = std::make_shared<Scope>();
        frame->parent = fn->closure;
        frame->info = fn->locals;
        bind_arguments(*fn, args, *frame);

        ScopeSwap swap(scope_, std::move(frame));
        if (fn->lambda_body != nullptr)
        {
            return eval(*fn->lambda_body);
        }
        if (exec_block(*fn->body) == Flow::Return)
        {
            return std::exchange(return_value_, Value::none());
        }
        return Value::none();
    }

    std::shared_ptr<FunctionObject> make_function(std::string name,
                                                  const std::vector<Param>& params,
                                                  const LocalInfo* locals)
    {
        auto fn = std::make_shared<FunctionObject>();
        fn->name = std::move(name);
        fn->params = &params;
        fn->locals = locals;
        fn->closure = scope_;
        for (const auto& p : params)
        {
            fn->defaults.push_back(p.default_value ? std::optional<Value>(eval(*p.default_value))
                                                   : std::nullopt);
        }
        if (captured_.empty() || captured_.back().lock() != scope_)
        {
            captured_.push_back(scope_);
        }
        return fn;
    }

    CallArgs eval_arguments(const std::vector<Argument>& args)
    {
        CallArgs out;
        for (const auto& arg : args)
        {
            Value value = eval(*arg.value);
            if (arg.star)
            {
                for_each(value,
                         [&out](const Value& item)
                         {
                             out.positional.push_back(item);
                             return true;
                         });
            }
            else if (arg.keyword.has_value())
            {
                for (const auto& kw : out.keywords)
                {
                    if (kw.first == *arg.keyword)
                    {
                        raise("SyntaxError", "keyword argument repeated: " + *arg.keyword);
                    }
                }
                out.keywords.emplace_back(*arg.keyword, std::move(value));
            }
            else
            {
                out.positional.push_back(std::move(value));
            }
        }
        return out;
    }

    // Statements --------------------------------------------------------------------------

    Flow exec_block(const Block& block)
    {
        for (const auto& stmt : block.stmts)
        {
            const Flow flow = exec_stmt(stmt);
            if (flow != Flow::Normal)
            {
                return flow;
            }
        }
        return Flow::Normal;
    }

    Flow exec_stmt(const Stmt& stmt)
    {
        try
        {
            return std::visit([&](const auto& node) { return exec_node(node); }, stmt.node);
        }
        catch (ScriptError& e)
        {
            if (!e.span.has_value())
            {
                e.span = stmt.span;
            }
            throw;
        }
    }

    Flow exec_node(const ExprStmt& s)
    {
        (void)eval(s.expr);
        return Flow::Normal;
    }

    Flow exec_node(const AssignStmt& s)
    {
        Value value = eval(s.value);
        for (const auto& target : s.targets)
        {
            assign(target, value);
        }
        return Flow::Normal;
    }

    Value inplace(BinaryOp op, const Value& lhs, const Value& rhs)
    {
        if (op == BinaryOp::Add && lhs.is(ValueKind::List))
        {
            auto& items = lhs.as_list().items;
            std::vector<Value> more = to_vector(rhs);
            check_sequence_length(items.size() + more.size());
            items.insert(items.end(), more.begin(), more.end());
            return lhs;
        }
        if (lhs.is(ValueKind::Set) && rhs.is(ValueKind::Set) &&
            (op == BinaryOp::BitOr || op == BinaryOp::BitAnd || op == BinaryOp::Sub ||
             op == BinaryOp::BitXor))
        {
            Value result = binary_op(op, lhs, rhs);
            lhs.as_set().table = std::move(result.as_set().table);
            return lhs;
        }
        return binary_op(op, lhs, rhs);
    }

    Flow exec_node(const AugAssignStmt& s)
    {
        const Expr& target = s.target;
        if (const auto* name = std::get_if<NameExpr>(&target.node))
        {
            Value current = load_name(name->name);
            Value rhs = eval(s.value);
            store_name(name->name, inplace(s.op, current, rhs));
        }
        else if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
        {
            Value base = eval(*sub->base);
            if (const auto* slice = std::get_if<SliceExpr>(&sub->index->node))
            {
                const SliceValue bounds = eval_slice(*slice);
                Value current = get_slice(base, bounds);
                Value rhs = eval(s.value);
                set_slice(base, bounds, inplace(s.op, current, rhs));
            }
            else
            {
                Value index = eval(*sub->index);
                Value current = get_item(base, index);
                Value rhs = eval(s.value);
                set_item(base, index, inplace(s.op, current, rhs));
            }
        }
        else if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
        {
            Value base = eval(*attr->base);
            raise_attribute_error(base, attr->name);
        }
        else
        {
            raise("SyntaxError", "illegal expression for augmented assignment");
        }
        return Flow::Normal;
    }

    Flow exec_node(const IfStmt& s)
    {
        if (truthy(eval(s.cond)))
        {
            return exec_block(*s.then_block);
        }
        if (s.else_block)
        {
            return exec_block(*s.else_block);
        }
        return Flow::Normal;
    }

    Flow exec_node(const WhileStmt& s)
    {
        while (truthy(eval(s.cond)))
        {
            const Flow flow = exec_block(*s.body);
            if (flow == Flow::Break)
            {
                return Flow::Normal;
            }
            if (flow == Flow::Return)
            {
                return flow;
            }
        }
        if (s.else_block)
        {
            return exec_block(*s.else_block);
        }
        return Flow::Normal;
    }

    Flow exec_node(const ForStmt& s)
    {
        Value iterable = eval(s.iter);
        bool broke = false;
        bool returned = false;
        for_each(iterable,
                 [&](const Value& item)
                 {
                     assign(s.target, item);
                     const Flow flow = exec_block(*s.body);
                     if (flow == Flow::Break)
                     {
                         broke = true;
                         return false;
                     }
                     if (flow == Flow::Return)
                     {
                         returned = true;
                         return false;
                     }
                     return true;
                 });
        if (returned)
        {
            return Flow::Return;
        }
        if (!broke && s.else_block)
        {
            return exec_block(*s.else_block);
        }
        return Flow::Normal;
    }

    Flow exec_node(const BreakStmt&) { return Flow::Break; }
    Flow exec_node(const ContinueStmt&) { return Flow::Continue; }
    Flow exec_node(const PassStmt&) { return Flow::Normal; }

    Flow exec_node(const ReturnStmt& s)
    {
        return_value_ = s.value.has_value() ? eval(*s.value) : Value::none();
        return Flow::Return;
    }

    Flow exec_node(const FunctionDef& s)
    {
        const LocalInfo* locals = locals_for(&s, s.params, s.body.get());
        auto fn = make_function(s.name, s.params, locals);
        fn->body = s.body.get();
        store_name(s.name, Value::function(std::move(fn)));
        return Flow::Normal;
    }

    Flow exec_node(const GlobalStmt&) { return Flow::Normal; }

    Flow exec_node(const NonlocalStmt& s)
    {
        for (const auto& name : s.names)
        {
            (void)nonlocal_scope(name);
        }
        return Flow::Normal;
    }

    Flow exec_node(const DelStmt& s)
    {
        for (const auto& target : s.targets)
        {
            delete_target(target);
        }
        return Flow::Normal;
    }

    Flow exec_node(const AssertStmt& s)
    {
        if (!truthy(eval(s.test)))
        {
            raise("AssertionError", s.message.has_value() ? to_str(eval(*s.message)) : "");
        }
        return Flow::Normal;
    }

    // Targets -----------------------------------------------------------------------------

    void assign(const Expr& target, const Value& value)
    {
        if (const auto* name = std::get_if<NameExpr>(&target.node))
        {
            store_name(name->name, value);
        }
        else if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
        {
            Value base = eval(*sub->base);
            if (const auto* slice = std::get_if<SliceExpr>(&sub->index->node))
            {
                set_slice(base, eval_slice(*slice), value);
            }
            else
            {
                set_item(base, eval(*sub->index), value);
            }
        }
        else if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
        {
            Value base = eval(*attr->base);
            raise_attribute_error(base, attr->name);
        }
        else if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
        {
            unpack(tuple->elements, value);
        }
        else if (const auto* list = std::get_if<ListExpr>(&target.node))
        {
            unpack(list->elements, value);
        }
        else
        {
            raise("SyntaxError", "cannot assign to expression");
        }
    }

    void unpack(const std::vector<Expr>& targets, const Value& value)
    {
        const std::vector<Value> items = to_vector(value);
        std::size_t star = targets.size();
        for (std::size_t i = 0; i < targets.size(); ++i)
        {
            if (std::holds_alternative<StarredExpr>(targets[i].node))
            {
                star = i;
            }
        }

        if (star == targets.size())
        {
            if (items.size() < targets.size())
            {
                value_error("not enough values to unpack (expected " +
                            std::to_string(targets.size()) + ", got " +
                            std::to_string(items.size()) + ")");
            }
            if (items.size() > targets.size())
            {
                value_error("too many values to unpack (expected " +
                            std::to_string(targets.size()) + ")");
            }
            for (std::size_t i = 0; i < targets.size(); ++i)
            {
                assign(targets[i], items[i]);
            }
            return;
        }

        const std::size_t fixed = targets.size() - 1;
        if (items.size() < fixed)
        {
            value_error("not enough values to unpack (expected at least " +
                        std::to_string(fixed) + ", got " + std::to_string(items.size()) + ")");
        }
        const std::size_t after = targets.size() - star - 1;
        for (std::size_t i = 0; i < star; ++i)
        {
            assign(targets[i], items[i]);
        }
        std::vector<Value> rest(items.begin() + static_cast<std::ptrdiff_t>(star),
                                items.end() - static_cast<std::ptrdiff_t>(after));
        assign(*std::get<StarredExpr>(targets[star].node).value, Value::list(std::move(rest)));
        for (std::size_t i = 0; i < after; ++i)
        {
            assign(targets[star + 1 + i], items[items.size() - after + i]);
        }
    }

    void delete_target(const Expr& target)
    {
        if (const auto* name = std::get_if<NameExpr>(&target.node))
        {
            delete_name(name->name);
        }
        else if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
        {
            Value base = eval(*sub->base);
            if (const auto* slice = std::get_if<SliceExpr>(&sub->index->node))
            {
                del_slice(base, eval_slice(*slice));
            }
            else
            {
                del_item(base, eval(*sub->index));
            }
        }
        else if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
        {
            Value base = eval(*attr->base);
            raise_attribute_error(base, attr->name);
        }
        else if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
        {
            for (const auto& e : tuple->elements)
            {
                delete_target(e);
            }
        }
        else if (const auto* list = std::get_if<ListExpr>(&target.node))
        {
            for (const auto& e : list->elements)
            {
                delete_target(e);
            }
        }
        else
        {
            raise("SyntaxError", "cannot delete expression");
        }
    }

    [[noreturn]] static void raise_attribute_error(const Value& base, const std::string& name)
    {
        raise("AttributeError",
              "'" + type_name(base) + "' object has no attribute '" + name + "'");
    }

    // Expressions -------------------------------------------------------------------------

    Value eval(const Expr& e)
    {
        return std::visit([&](const auto& node) { return eval_node(node); }, e.node);
    }

    SliceValue eval_slice(const SliceExpr& s)
    {
        return SliceValue{.lower = s.lower ? eval(*s.lower) : Value::none(),
                          .upper = s.upper ? eval(*s.upper) : Value::none(),
                          .step = s.step ? eval(*s.step) : Value::none()};
    }

    Value eval_node(const NoneExpr&) { return Value::none(); }
    Value eval_node(const BoolExpr& n) { return Value::boolean(n.value); }
    Value eval_node(const IntExpr& n) { return Value::integer(n.value); }
    Value eval_node(const FloatExpr& n) { return Value::floating(n.value); }
    Value eval_node(const StringExpr& n) { return Value::str(n.value); }

    Value eval_node(const FStringExpr& n)
    {
        std::string out;
        for (const auto& part : n.parts)
        {
            if (!part.expr)
            {
                out += part.literal;
                continue;
            }
            Value value = eval(*part.expr);
            if (part.conversion == 'r')
            {
                value = Value::str(repr(value));
            }
            else if (part.conversion == 's')
            {
                value = Value::str(to_str(value));
            }
            out += format_value(value, part.format_spec);
            check_string_length(out.size());
        }
        return Value::str(std::move(out));
    }

    Value eval_node(const NameExpr& n) { return load_name(n.name); }

    Value eval_node(const UnaryExpr& n) { return unary_op(n.op, eval(*n.operand)); }

    Value eval_node(const BinaryExpr& n)
    {
        Value lhs = eval(*n.lhs);
        Value rhs = eval(*n.rhs);
        return binary_op(n.op, lhs, rhs);
    }

    Value eval_node(const BoolOpExpr& n)
    {
        Value lhs = eval(*n.lhs);
        const bool lhs_true = truthy(lhs);
        if ((n.op == BoolOp::And) ? !lhs_true : lhs_true)
        {
            return lhs;
        }
        return eval(*n.rhs);
    }

    Value eval_node(const CompareExpr& n)
    {
        Value lhs = eval(*n.first);
        for (const auto& link : n.links)
        {
            Value rhs = eval(*link.rhs);
            if (!compare(link.op, lhs, rhs))
            {
                return Value::boolean(false);
            }
            lhs = std::move(rhs);
        }
        return Value::boolean(true);
    }

    Value eval_node(const IfExpr& n)
    {
        return truthy(eval(*n.cond)) ? eval(*n.then_value) : eval(*n.else_value);
    }

    Value eval_node(const CallExpr& n)
    {
        if (const auto* attr = std::get_if<AttributeExpr>(&n.callee->node))
        {
            Value self = eval(*attr->base);
            if (!has_method(self, attr->name))
            {
                raise_attribute_error(self, attr->name);
            }
            CallArgs args = eval_arguments(n.args);
            return call_method(*this, self, attr->name, args);
        }
        Value callee = eval(*n.callee);
        return call(callee, eval_arguments(n.args));
    }

    Value eval_node(const AttributeExpr& n)
    {
        Value base = eval(*n.base);
        if (!has_method(base, n.name))
        {
            raise_attribute_error(base, n.name);
        }
        return Value::bound_method(std::move(base), n.name);
    }

    Value eval_node(const SubscriptExpr& n)
    {
        Value base = eval(*n.base);
        if (const auto* slice = std::get_if<SliceExpr>(&n.index->node))
        {
            return get_slice(base, eval_slice(*slice));
        }
        return get_item(base, eval(*n.index));
    }

    Value eval_node(const SliceExpr&)
    {
        raise("SyntaxError", "slice outside of a subscript");
    }

    Value eval_node(const StarredExpr&)
    {
        raise("SyntaxError", "can't use starred expression here");
    }

    std::vector<Value> eval_elements(const std::vector<Expr>& elements)
    {
        std::vector<Value> out;
        for (const auto& e : elements)
        {
            if (const auto* starred = std::get_if<StarredExpr>(&e.node))
            {
                std::vector<Value> more = to_vector(eval(*starred->value));
                check_sequence_length(out.size() + more.size());
                out.insert(out.end(), more.begin(), more.end());
            }
            else
            {
                out.push_back(eval(e));
            }
        }
        return out;
    }

    Value eval_node(const ListExpr& n) { return Value::list(eval_elements(n.elements)); }
    Value eval_node(const TupleExpr& n) { return Value::tuple(eval_elements(n.elements)); }

    Value eval_node(const SetExpr& n)
    {
        Value out = Value::set();
        for (auto& item : eval_elements(n.elements))
        {
            out.as_set().table.insert_or_assign(std::move(item), Value::none());
        }
        return out;
    }

    Value eval_node(const DictExpr& n)
    {
        Value out = Value::dict();
        for (std::size_t i = 0; i < n.keys.size(); ++i)
        {
            Value key = eval(n.keys[i]);
            Value value = eval(n.values[i]);
            out.as_dict().table.insert_or_assign(std::move(key), std::move(value));
        }
        return out;
    }

    void run_clauses(const ComprehensionExpr& comp, std::size_t index, const Value& first_iter,
                     const std::function<void()>& emit)
    {
        const CompFor& clause = comp.clauses[index];
        const Value iterable = index == 0 ? first_iter : eval(*clause.iter);
        for_each(iterable,
                 [&](const Value& item)
                 {
                     assign(*clause.target, item);
                     for (const auto& cond : clause.conditions)
                     {
                         if (!truthy(eval(cond)))
                         {
                             return true;
                         }
                     }
                     if (index + 1 < comp.clauses.size())
                     {
                         run_clauses(comp, index + 1, first_iter, emit);
                     }
                     else
                     {
                         emit();
                     }
                     return true;
                 });
    }

    Value eval_node(const ComprehensionExpr& n)
    {
        // The outermost iterable is evaluated in the enclosing scope.
        Value first_iter = eval(*n.clauses.front().iter);

        auto frame = std::make_shared<Scope>();
        frame->parent = scope_;
        frame->info = locals_for(n);
        ScopeSwap swap(scope_, std::move(frame));

        switch (n.kind)
        {
        case ComprehensionKind::Dict:
        {
            Value out = Value::dict();
            run_clauses(n, 0, first_iter,
                        [&]
                        {
                            Value key = eval(*n.element);
                            Value value = eval(*n.value);
                            out.as_dict().table.insert_or_assign(std::move(key), std::move(value));
                        });
            return out;
        }
        case ComprehensionKind::Set:
        {
            Value out = Value::set();
            run_clauses(n, 0, first_iter,
                        [&] { out.as_set().table.insert_or_assign(eval(*n.element), Value::none()); });
            return out;
        }
        case ComprehensionKind::List:
        case ComprehensionKind::Generator:
        {
            std::vector<Value> items;
            run_clauses(n, 0, first_iter,
                        [&]
                        {
                            check_sequence_length(items.size() + 1);
                            items.push_back(eval(*n.element));
                        });
            if (n.kind == ComprehensionKind::Generator)
            {
                return Value::iterator(std::move(items), "generator");
            }
            return Value::list(std::move(items));
        }
        }
        return Value::none();
    }

    Value eval_node(const LambdaExpr& n)
    {
        const LocalInfo* locals = locals_for(&n, n.params, nullptr);
        auto fn = make_function("<lambda>", n.params, locals);
        fn->lambda_body = n.body.get();
        return Value::function(std::move(fn));
    }
};

std::optional<std::size_t> line_of(std::string_view source, const std::optional<Span>& span)
{
    if (!span.has_value())
    {
        return std::nullopt;
    }
    const sandpit::source::LineMap map(source);
    return map.offset_to_line_col(span->start).line;
}

} // namespace

void OutputBuffer::append(std::string_view text)
{
    if (truncated_)
    {
        return;
    }
    const std::size_t room = max_bytes_ - text_.size();
    if (text.size() <= room)
    {
        text_.append(text);
        return;
    }
    std::size_t cut = room;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
    {
        --cut;
    }
    text_.append(text.substr(0, cut));
    truncated_ = true;
}

std::string OutputBuffer::finish() const
{
    if (!truncated_)
    {
        return text_;
    }
    return text_ + std::string(kTruncationMarker);
}

std::string RunResult::error_text() const
{
    if (ok)
    {
        return {};
    }
    std::string out = error_type;
    if (!error_message.empty())
    {
        out += ": " + error_message;
    }
    if (error_line.has_value())
    {
        out += " (line " + std::to_string(*error_line) + ")";
    }
    return out;
}

RunResult run_program(const Program& program, std::string_view source, const RunOptions& options)
{
    RunResult result;
    RecursionLimit limit(options.max_call_depth);
    Interpreter interpreter(options);
    auto fail = [&](std::string type, std::string message, std::optional<std::size_t> line)
    {
        result.ok = false;
        result.error_type = std::move(type);
        result.error_message = std::move(message);
        result.error_line = line;
    };
    try
    {
        interpreter.run(program);
    }
    catch (const ScriptError& e)
    {
        fail(e.type(), e.message(), line_of(source, e.span));
    }
    catch (const std::bad_alloc&)
    {
        fail("MemoryError", "", std::nullopt);
    }
    catch (const std::length_error&)
    {
        fail("MemoryError", "", std::nullopt);
    }
    result.output = interpreter.output().finish();
    result.truncated = interpreter.output().truncated();
    return result;
}

RunResult run_source(std::string_view source, const RunOptions& options)
{
    auto parsed = sandpit::parser::parse_source(source);
    if (auto* diags = std::get_if<std::vector<sandpit::diag::Diagnostic>>(&parsed))
    {
        RunResult result;
        result.ok = false;
        result.error_type = "SyntaxError";
        if (!diags->empty())
        {
            result.error_message = diags->front().message;
            result.error_line = line_of(source, diags->front().span);
        }
        return result;
    }
    return run_program(std::get<Program>(parsed), source, options);
}

} // namespace sandpit::runtime
