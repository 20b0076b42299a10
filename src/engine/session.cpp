#include <pathfork/engine/session.h>
#include <pathfork/log/trace.h>

namespace pathfork::engine
{

Session::Session(pathfork::config::BrancherConfig config)
    : config_(config), oracle_(), bookkeeper_(), compressor_(oracle_), classifier_(),
      brancher_(oracle_, compressor_, bookkeeper_, config_),
      joiner_(brancher_, classifier_, bookkeeper_)
{
}

void Session::start()
{
    if (config_.trace)
    {
        pathfork::log::set_trace_enabled(true);
    }
    brancher_.start();
}

void Session::reset()
{
    brancher_.reset();
    bookkeeper_.reset();
}

void Session::stop()
{
    brancher_.stop();
}

} // namespace pathfork::engine
