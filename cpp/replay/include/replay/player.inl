namespace replay {

std::string_view PresenceString(PlayerPresence presence) {
  switch (presence) {
    case PlayerPresence::NotPresent:
      return "not-present";
    case PlayerPresence::Initializing:
      return "initializing";
    case PlayerPresence::Reconnecting:
      return "reconnecting";
    case PlayerPresence::Present:
      return "present";
    case PlayerPresence::Error:
      return "error";
  }
  return "unknown";
}

std::string_view SeverityString(ProblemSeverity severity) {
  switch (severity) {
    case ProblemSeverity::Info:
      return "info";
    case ProblemSeverity::Warn:
      return "warn";
    case ProblemSeverity::Error:
      return "error";
  }
  return "unknown";
}

bool IsRangeCoveredByRanges(const FractionRange& range,
                            const std::vector<FractionRange>& ranges) {
  for (const auto& candidate : ranges) {
    if (candidate.start <= range.start && candidate.end >= range.end) {
      return true;
    }
  }
  return false;
}

}  // namespace replay
