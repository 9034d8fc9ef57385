/*
 * Copyright 2023-2026 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file Logging.hh
 * @brief Stream-style logging front-end shared by every HierSim component
 *
 * Every message is composed into a LogOStream temporary and flushed in its destructor, so one
 * statement produces one line even when several threads log concurrently:
 *
 * ```cpp
 * CLASS_INFO << "Mapped region " << name;          // label = demangled type name of *this
 * LABELED_WARNING("memTrace") << "bad line";       // explicit label
 * LABELED_ASSERT_MSG(ok, "Config", "bad " << key); // logs and throws when !ok
 * ```
 *
 * The prefix carries the current simulated cycle of the global `top` instance (or `Cycle=N/A`
 * before one exists). Error severity throws std::runtime_error once the line is written; an
 * uncaught one ends up in LogOStream::handleTerminate().
 *
 * VERBOSE_* variants are compiled in only when HIERSIM_VERBOSE is defined.
 */

#pragma once

#include <atomic>
#include <sstream>
#include <string>

namespace hiersim {

enum class LoggingSeverity { L_STATISTICS, L_INFO, L_WARNING, L_ERROR };

/**
 * @brief ANSI Select Graphic Rendition escape sequence.
 */
class ANSI_SGR {
public:
	enum class PARAMETER : int {
		RESET     = 0,
		BOLD      = 1,
		FG_RED    = 31,
		FG_GREEN  = 32,
		FG_YELLOW = 33,
		FG_BLUE   = 34
	};

	ANSI_SGR(PARAMETER _param) : param(_param) {}

	std::string getCode() const { return "\033[" + std::to_string(static_cast<int>(this->param)) + "m"; }

private:
	PARAMETER param;
};

class LogOStream {
public:
	LogOStream(LoggingSeverity _level, const char* _file, int _line, const std::string& _label = "");

	/**
	 * @brief Flushes the composed line. Throws std::runtime_error for LoggingSeverity::L_ERROR.
	 */
	~LogOStream() noexcept(false);

	template <typename T>
	LogOStream& operator<<(const T& _msg) {
		this->ss << _msg;
		return *this;
	}

	/**
	 * @brief Terminate handler printing the in-flight exception exactly once before aborting.
	 */
	[[noreturn]] static void handleTerminate();

private:
	void setPrefix();

	LoggingSeverity   level;
	const char*       file;
	int               line;
	std::string       label;
	std::stringstream ss;

	static inline std::atomic<bool> hasCalledTerminate = false;
};

}  // namespace hiersim

#define HIERSIM_LOG_OSTREAM(severity, label) \
	::hiersim::LogOStream(::hiersim::LoggingSeverity::severity, __FILE__, __LINE__, label)

// Swallows a streamed expression without evaluating it.
#define HIERSIM_LOG_DISCARD(stream) \
	if (true) {                     \
	} else                          \
		stream

#define LABELED_STATISTICS(label) HIERSIM_LOG_OSTREAM(L_STATISTICS, label)
#define LABELED_INFO(label)       HIERSIM_LOG_OSTREAM(L_INFO, label)
#define LABELED_WARNING(label)    HIERSIM_LOG_OSTREAM(L_WARNING, label)
#define LABELED_ERROR(label)      HIERSIM_LOG_OSTREAM(L_ERROR, label)

#define LABELED_ASSERT_MSG(cond, label, msg) \
	if (cond) {                              \
	} else                                   \
		LABELED_ERROR(label) << "Assertion `" #cond "` failed: " << msg

#define LABELED_ASSERT(cond, label) LABELED_ASSERT_MSG(cond, label, "")

#define CLASS_STATISTICS           LABELED_STATISTICS(this->getTypeName())
#define CLASS_INFO                 LABELED_INFO(this->getTypeName())
#define CLASS_WARNING              LABELED_WARNING(this->getTypeName())
#define CLASS_ERROR                LABELED_ERROR(this->getTypeName())
#define CLASS_ASSERT_MSG(cond, msg) LABELED_ASSERT_MSG(cond, this->getTypeName(), msg)
#define CLASS_ASSERT(cond)         CLASS_ASSERT_MSG(cond, "")

#define LOG_STATISTICS LABELED_STATISTICS("")
#define LOG_INFO       LABELED_INFO("")
#define LOG_WARNING    LABELED_WARNING("")
#define LOG_ERROR      LABELED_ERROR("")

#define ASSERT_MSG(cond, msg) LABELED_ASSERT_MSG(cond, "", msg)

#ifdef HIERSIM_VERBOSE
#define VERBOSE_LABELED_INFO(label) LABELED_INFO(label)
#define VERBOSE_CLASS_INFO          CLASS_INFO
#define LOG_DEBUG                   LABELED_INFO("Debug")
#else
#define VERBOSE_LABELED_INFO(label) HIERSIM_LOG_DISCARD(LABELED_INFO(label))
#define VERBOSE_CLASS_INFO          HIERSIM_LOG_DISCARD(CLASS_INFO)
#define LOG_DEBUG                   HIERSIM_LOG_DISCARD(LABELED_INFO("Debug"))
#endif  // HIERSIM_VERBOSE
