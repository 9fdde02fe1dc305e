#pragma once

#include <cstdio>
#include <string>

#include "logger.hpp"
#include "error.hpp"

// Appends formatted entries to a host file.  Entries are dropped until create() succeeds.
class FileLog : public Logger {

private:
	std::string m_path;
	FILE *m_file;
	unsigned int m_num_entries;

public:
	FileLog(const char *path) : Logger("FileLog"), m_path(path), m_file(nullptr), m_num_entries(0) {}

	~FileLog() {
		if (m_file)
			fclose(m_file);
	}

	void create() override {
		if (m_file)
			return;
		m_file = fopen(m_path.c_str(), "a");
		if (!m_file)
			throw CONFIG_FILE_ERROR;
		if (ftell(m_file) == 0 && get_log_formatter())
			fputs(get_log_formatter()->header().c_str(), m_file);
	}

	void truncate() override {
		if (m_file) {
			fclose(m_file);
			m_file = nullptr;
		}
		m_file = fopen(m_path.c_str(), "w");
		if (!m_file)
			throw CONFIG_FILE_ERROR;
		m_num_entries = 0;
		if (get_log_formatter())
			fputs(get_log_formatter()->header().c_str(), m_file);
	}

	bool is_ready() override { return m_file != nullptr; }
	unsigned int num_entries() override { return m_num_entries; }
	void read(void *, int) override { }

	void write(void *entry) override {
		if (!m_file || !get_log_formatter())
			return;
		fputs(get_log_formatter()->log_entry(*static_cast<const LogEntry *>(entry)).c_str(), m_file);
		fflush(m_file);
		m_num_entries++;
	}
};
