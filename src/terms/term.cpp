#include <algorithm>
#include <cstddef>
#include <iterator>
#include <pathfork/terms/term.h>

namespace pathfork::terms
{

bool TermLess::operator()(const Term& a, const Term& b) const
{
    return Z3_get_ast_id(a.ctx(), a) < Z3_get_ast_id(b.ctx(), b);
}

bool same(const Term& a, const Term& b)
{
    return z3::eq(a, b);
}

bool same(const std::vector<Term>& a, const std::vector<Term>& b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (!same(a[i], b[i]))
        {
            return false;
        }
    }
    return true;
}

Term conjoin(z3::context& ctx, const std::vector<Term>& terms)
{
    if (terms.empty())
    {
        return ctx.bool_val(true);
    }
    if (terms.size() == 1)
    {
        return terms.front();
    }

    z3::expr_vector args(ctx);
    for (const auto& t : terms)
    {
        args.push_back(t);
    }
    return z3::mk_and(args);
}

Term conjoin(z3::context& ctx, const TermSet& terms)
{
    return conjoin(ctx, std::vector<Term>(terms.begin(), terms.end()));
}

Term negate(const Term& term)
{
    return !term;
}

std::vector<Term> negate_each(const std::vector<Term>& terms)
{
    std::vector<Term> out;
    out.reserve(terms.size());
    for (const auto& t : terms)
    {
        out.push_back(negate(t));
    }
    return out;
}

Term ite(const Term& guard, const Term& then_term, const Term& else_term)
{
    return z3::ite(guard, then_term, else_term);
}

TermSet set_difference(const TermSet& a, const TermSet& b)
{
    TermSet out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::inserter(out, out.end()),
                        TermLess{});
    return out;
}

std::string to_string(const Term& term)
{
    return term.to_string();
}

} // namespace pathfork::terms
