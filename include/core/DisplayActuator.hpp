#pragma once
/** @file  DisplayActuator.hpp
 *  @brief Monitor layout switches and the bar/wallpaper restarts they need.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

namespace hyprdock {
  namespace io {
    class CommandRunner;
  }

  namespace core {

    class Logger;
    class MonitorProbe;
    struct MonitorConfig;

    /**
 * @class DisplayActuator
 * @brief Issues configured commands in fixed order; every spawn is fire-and-forget.
 *
 *  * The `enable*`, `extend` and `mirror` operations probe first and are safe
 *    to repeat: bar and wallpaper are only restarted when the internal panel
 *    actually changes state.
 *  * The `switchTo*` primitives do not probe; callers that already branched on
 *    a probe use them to avoid a second, redundant restart.
 */
    class DisplayActuator {
    public:
      DisplayActuator(const MonitorConfig& config, io::CommandRunner& runner,
                      const MonitorProbe& probe, Logger& log);

      // ---- layout operations ----------------------------------------------
      void enableInternalOnly();
      void enableExternalOnly();
      void extend();
      void mirror();

      // ---- dependent processes --------------------------------------------
      void restartWallpaper();
      void restartBar(); ///< close, then open
      void fixBar();     ///< bar reload
      void restartInternal(); ///< enable internal, wallpaper, bar, reload

      // ---- primitives -------------------------------------------------------
      void switchToInternal(); ///< enable internal, disable external
      void switchToExternal(); ///< disable internal, enable external
      void applyExtend();      ///< extend command only
      void applyMirror();      ///< mirror command only

      // ---- power / media ----------------------------------------------------
      void stopMedia();
      void lockAndSuspend(); ///< lock, then suspend immediately

    private:
      void ensureInternalActive();

      const MonitorConfig& config_;
      io::CommandRunner& runner_;
      const MonitorProbe& probe_;
      Logger& log_;
    };

  } // namespace core
} // namespace hyprdock
