#pragma once
/** @file  LidEvent.hpp
 *  @brief Lid notification decoded from one acpid socket record.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <string>
#include <string_view>

namespace hyprdock {
  namespace protocols {

    struct LidEvent {
      enum class Kind { Close, Open, Unrecognized };

      static constexpr std::string_view kCloseRecord = "button/lid LID close\n";
      static constexpr std::string_view kOpenRecord = "button/lid LID open\n";

      Kind kind{ Kind::Unrecognized };
      std::string text; ///< raw record as read off the socket

      /// Exact match against the acpid records; anything else is Unrecognized.
      static LidEvent fromWire(const std::string& record) {
        LidEvent ev;
        ev.text = record;
        if (record == kCloseRecord)
          ev.kind = Kind::Close;
        else if (record == kOpenRecord)
          ev.kind = Kind::Open;
        return ev;
      }
    };

    inline const char* toString(LidEvent::Kind k) {
      switch (k) {
      case LidEvent::Kind::Close:
        return "Close";
      case LidEvent::Kind::Open:
        return "Open";
      default:
        return "Unrecognized";
      }
    }

  } // namespace protocols
} // namespace hyprdock
