#include <pathfork/engine/fact_classifier.h>

namespace pathfork::engine
{

FactPartition QuantifierFactClassifier::partition(const TermSet& facts) const
{
    FactPartition out;
    for (const auto& fact : facts)
    {
        if (fact.is_quantifier() && fact.is_forall())
        {
            out.top_level.insert(fact);
        }
        else
        {
            out.nested.insert(fact);
        }
    }
    return out;
}

} // namespace pathfork::engine
