#pragma once

#include <pathfork/config/config.h>
#include <pathfork/engine/bookkeeper.h>
#include <pathfork/engine/brancher.h>
#include <pathfork/engine/fact_classifier.h>
#include <pathfork/engine/joiner.h>
#include <pathfork/state/compressor.h>
#include <pathfork/verification/z3_oracle.h>

/**
 * @file session.h
 * @brief One verifier session: the oracle plus the branching machinery wired to it.
 */

namespace pathfork::engine
{

/**
 * @brief Owns a Z3 oracle and the components that branch and join over it.
 *
 * start() must be called before branching. reset() restarts branch numbering and clears
 * statistics between verification runs; stop() ends the session.
 */
class Session
{
  public:
    explicit Session(pathfork::config::BrancherConfig config = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();
    void reset();
    void stop();

    [[nodiscard]] pathfork::verification::Z3Oracle& oracle() { return oracle_; }
    [[nodiscard]] z3::context& context() { return oracle_.context(); }
    [[nodiscard]] Brancher& brancher() { return brancher_; }
    [[nodiscard]] Joiner& joiner() { return joiner_; }
    [[nodiscard]] const Bookkeeper& bookkeeper() const { return bookkeeper_; }
    [[nodiscard]] const pathfork::config::BrancherConfig& config() const { return config_; }

  private:
    pathfork::config::BrancherConfig config_;
    pathfork::verification::Z3Oracle oracle_;
    Bookkeeper bookkeeper_;
    pathfork::state::MergingHeapCompressor compressor_;
    QuantifierFactClassifier classifier_;
    Brancher brancher_;
    Joiner joiner_;
};

} // namespace pathfork::engine
