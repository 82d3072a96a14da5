#ifndef __RV_TMUX_MULTIPLEXER__
#define __RV_TMUX_MULTIPLEXER__

#include "Multiplexer.hpp"
#include "SubprocessUtils.hpp"

namespace rv {
/**
 * @brief Drives the tmux server of the current user through the tmux CLI.
 */
class TmuxMultiplexer : public Multiplexer {
 public:
  explicit TmuxMultiplexer(shared_ptr<SubprocessUtils> _subprocessUtils,
                           const string& _tmuxPath = "tmux");
  virtual ~TmuxMultiplexer() {}

  virtual bool hasSession(const string& name);
  virtual void newSession(const string& name);
  virtual string newWindow(const string& session, const string& window);
  virtual void execInPane(const string& paneTarget, const string& command);

 protected:
  SubprocessResult runTmux(const vector<string>& args);
  void runTmuxOrThrow(const vector<string>& args, SubprocessResult* result);

  shared_ptr<SubprocessUtils> subprocessUtils;
  string tmuxPath;
};
}  // namespace rv

#endif  // __RV_TMUX_MULTIPLEXER__
