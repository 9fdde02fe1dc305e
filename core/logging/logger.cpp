#include <ctime>

#include "debug.hpp"
#include "logger.hpp"


const char *LogFormatter::log_level_str(LogType t) {
		switch (t) {
		case LogType::LOG_ERROR:
			return "ERROR";
		case LogType::LOG_WARN:
			return "WARN";
		case LogType::LOG_INFO:
			return "INFO";
		case LogType::LOG_TRACE:
			return "TRACE";
		case LogType::LOG_DFU_PROGRESS:
			return "PROGRESS";
		case LogType::LOG_DFU_STATE:
			return "STATE";
		case LogType::LOG_DFU_RESULT:
			return "RESULT";
		default:
			return "UNKNOWN";
		}
}

void Logger::sync_datetime(LogHeader &header) {
#ifdef DEBUG_USING_HOST_CLOCK
	std::time_t now = std::time(nullptr);
	std::tm *tm = std::gmtime(&now);
	if (tm) {
		header.year = tm->tm_year + 1900;
		header.month = tm->tm_mon + 1;
		header.day = tm->tm_mday;
		header.hours = tm->tm_hour;
		header.minutes = tm->tm_min;
		header.seconds = tm->tm_sec;
	}
	else
#endif
	{
		header.year = header.month = header.day = header.hours = header.minutes = header.seconds = 0;
	}
}

Logger::Logger(const char *name) {
	m_log_formatter = nullptr;
	m_unique_id = LoggerManager::add(*this);
	m_name = name;
}

Logger::~Logger() {
	LoggerManager::remove(*this);
}

void Logger::set_log_level(int level) {
	m_log_level = level;
}

int Logger::get_log_level() {
	return m_log_level;
}

void Logger::set_log_formatter(LogFormatter* formatter) {
	m_log_formatter = formatter;
}

LogFormatter* Logger::get_log_formatter() {
	return m_log_formatter;
}

void Logger::vlog(LogType type, const char *msg, va_list args) {
	LogEntry buffer;
	vsnprintf(reinterpret_cast<char*>(buffer.data), sizeof(buffer.data), msg, args);
	buffer.header.log_type = type;
	buffer.header.payload_size = std::strlen(reinterpret_cast<char*>(buffer.data));
	sync_datetime(buffer.header);
	write(&buffer);
}

void Logger::warn(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_WARN) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_WARN, msg, args);
		va_end(args);
	}
}

void Logger::error(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_ERROR) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_ERROR, msg, args);
		va_end(args);
	}
}

void Logger::info(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_INFO, msg, args);
		va_end(args);
	}
}

void Logger::trace(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_DEBUG) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_TRACE, msg, args);
		va_end(args);
	}
}

void Logger::show_info() {
	DEBUG_INFO("Logger %s has %u entries", m_name, num_entries());
}

unsigned int Logger::get_unique_id() {
	return m_unique_id;
}

const char *Logger::get_name() {
	return m_name;
}

unsigned int LoggerManager::add(Logger& s) {
	m_map.insert({m_unique_identifier, s});
	return m_unique_identifier++;
}

void LoggerManager::remove(Logger& s) {
	m_map.erase(s.get_unique_id());
}

void LoggerManager::create() {
	for (auto const &s : m_map)
		s.second.create();
}

void LoggerManager::truncate()
{
	for (auto const &s : m_map)
		s.second.truncate();
}

void LoggerManager::set_log_level(int level)
{
	for (auto const &s : m_map)
		s.second.set_log_level(level);
}

void LoggerManager::show_info()
{
	for (auto const &s : m_map)
		s.second.show_info();
}

Logger *LoggerManager::find_by_name(const char *name) {
	for (auto const &s : m_map) {
		if (std::string(name) == std::string(s.second.get_name()))
			return &s.second;
	}

	return nullptr;
}
