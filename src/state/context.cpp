#include <pathfork/state/context.h>
#include <utility>

namespace pathfork::state
{

Context Context::with_branch_condition(const Term& guard) const
{
    Context out = *this;
    out.branch_conditions_.insert(out.branch_conditions_.begin(), guard);
    return out;
}

Context Context::with_branch_conditions(std::vector<Term> conditions) const
{
    Context out = *this;
    out.branch_conditions_ = std::move(conditions);
    return out;
}

Context Context::with_retrying(bool retrying) const
{
    Context out = *this;
    out.retrying_ = retrying;
    return out;
}

Context Context::with_visited(std::string member) const
{
    Context out = *this;
    out.visited_.push_back(std::move(member));
    return out;
}

Context Context::with_constrainable(const Term& permission) const
{
    Context out = *this;
    out.constrainable_.insert(permission);
    return out;
}

MergeResult Context::merge(const Context& other) const
{
    if (!pathfork::terms::same(branch_conditions_, other.branch_conditions_))
    {
        auto d = pathfork::diag::error("cannot merge contexts with different branch conditions");
        d.notes.push_back({"left has " + std::to_string(branch_conditions_.size()) +
                           ", right has " + std::to_string(other.branch_conditions_.size())});
        return d;
    }
    if (visited_ != other.visited_)
    {
        return pathfork::diag::error("cannot merge contexts with different visited members");
    }
    if (retrying_ != other.retrying_)
    {
        return pathfork::diag::error("cannot merge contexts with different retry flags");
    }

    Context out = *this;
    out.constrainable_.insert(other.constrainable_.begin(), other.constrainable_.end());
    return out;
}

} // namespace pathfork::state
