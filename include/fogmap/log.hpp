#pragma once
#include <functional>
#include <string>

namespace fogmap {

enum class LogLevel { info, warn };

using LogSink = std::function<void(LogLevel, const std::string&)>;

// 以降のメッセージの出力先を差し替える。空の sink を渡すとデフォルト
// （stderr に "[info] ..." / "[warn] ..."）に戻る。
void set_log_sink(LogSink sink);

void log_info(const std::string& msg);
void log_warn(const std::string& msg);

} // namespace fogmap
