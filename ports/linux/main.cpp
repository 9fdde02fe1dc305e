#include <csignal>
#include <cstdio>
#include <string>
#include <vector>
#include <unistd.h>

#include "console_log.hpp"
#include "file_log.hpp"
#include "sys_log.hpp"
#include "debug.hpp"
#include "error.hpp"
#include "config_store_file.hpp"
#include "package_archive.hpp"
#include "package_loader.hpp"
#include "dfu_session.hpp"
#include "buttonless.hpp"
#include "bluez_transport.hpp"
#include "platform.hpp"

#define EXIT_OK      0
#define EXIT_ERROR   1
#define EXIT_USAGE   2

// Cancellation target for SIGINT
static DFUSession *volatile active_session = nullptr;

static void on_sigint(int) {
	DFUSession *session = active_session;
	if (session)
		session->cancel();
}

static int usage(const char *name) {
	fprintf(stderr, "usage: %s [-c KEY=VALUE]... [-f config] [-l logfile] [-b] [-v] <device-id> trigger|app|sd|bl|sdbl [package]\n", name);
	fprintf(stderr, "  -c  set a parameter by name or key\n");
	fprintf(stderr, "  -f  parameter file\n");
	fprintf(stderr, "  -l  append log entries to file\n");
	fprintf(stderr, "  -b  trigger the buttonless service and reconnect to the bootloader first\n");
	fprintf(stderr, "  -v  verbose\n");
	return EXIT_USAGE;
}

static void print_progress(const DFUProgressLogEntry& entry) {
	if (entry.object_kind != DFUObjectKind::FIRMWARE || entry.total == 0)
		return;
	printf("\r%s: %3u%% (%u/%u)", image_kind_str(entry.image_kind),
			(unsigned int)(((uint64_t)entry.offset * 100) / entry.total), (unsigned int)entry.offset, (unsigned int)entry.total);
	if (entry.offset == entry.total)
		printf("\n");
	fflush(stdout);
}

int main(int argc, char **argv) {
	std::vector<std::string> assignments;
	std::string config_path;
	std::string log_path;
	bool is_verbose = false;
	bool is_buttonless_required = false;
	int opt;

	while ((opt = getopt(argc, argv, "c:f:l:bv")) != -1) {
		switch (opt) {
		case 'c': assignments.push_back(optarg); break;
		case 'f': config_path = optarg; break;
		case 'l': log_path = optarg; break;
		case 'b': is_buttonless_required = true; break;
		case 'v': is_verbose = true; break;
		default: return usage(argv[0]);
		}
	}

	if (argc - optind < 2)
		return usage(argv[0]);

	std::string device_id = argv[optind];
	std::string command = argv[optind + 1];
	DFUMode mode = DFUMode::APPLICATION;

	if (command != "trigger") {
		if (!dfu_mode_from_str(command, mode) || argc - optind < 3)
			return usage(argv[0]);
	}

	ConsoleLog console_log;
	DebugLogger::console_log = &console_log;

	SysLogFormatter log_formatter;
	FileLog *file_log = nullptr;
	DFUSession *session = nullptr;
	int status = EXIT_OK;

	try {
		FileConfigurationStore configuration_store(config_path);
		configuration_store.init();
		for (auto const &assignment : assignments)
			configuration_store.write_param(assignment);

		int log_level = is_verbose ? LOG_LEVEL_DEBUG : configuration_store.read_param<unsigned int>(ParamID::LOG_LEVEL);

		if (!log_path.empty()) {
			file_log = new FileLog(log_path.c_str());
			file_log->set_log_formatter(&log_formatter);
			file_log->create();
			DebugLogger::system_log = file_log;
		}

		LoggerManager::set_log_level(log_level);

		DFUConfig dfu_config;
		BLEConfig ble_config;
		ButtonlessConfig buttonless_config;
		configuration_store.get_dfu_configuration(dfu_config);
		configuration_store.get_ble_configuration(ble_config);
		configuration_store.get_buttonless_configuration(buttonless_config);

		BlueZTransport transport(ble_config);
		ButtonlessTrigger buttonless(transport, buttonless_config);

		if (command == "trigger") {
			transport.connect(device_id);
			buttonless.trigger();
			transport.disconnect();
			printf("Bootloader entry requested; the bootloader advertises as %s\n",
					buttonless.bootloader_identifier(device_id).c_str());
		} else {
			// The package is loaded before any radio activity
			FirmwarePackage package = PackageLoader::load(PackageArchive::open(argv[optind + 2]));

			session = new DFUSession(transport, dfu_config);
			session->set_progress_handler(print_progress);
			DFUSession::select_images(mode, package);

			active_session = session;
			std::signal(SIGINT, on_sigint);

			if (is_buttonless_required)
				buttonless.enter_bootloader(device_id);
			else
				transport.connect(device_id);

			session->run(mode, package);
			transport.disconnect();

			printf("DFU completed in %.2f seconds\n", session->elapsed_ms() / 1000.0);
		}
	} catch (ErrorCode e) {
		fprintf(stderr, "\nerror: %s\n", error_code_str(e));
		if (e == DFU_TARGET_ERROR && session) {
			fprintf(stderr, "target: %s", dfu_result_str(session->target_result()));
			if (session->target_result() == DFUResultCode::EXT_ERROR)
				fprintf(stderr, " (%s)", dfu_ext_error_str(session->target_ext_error()));
			fprintf(stderr, "\n");
		}
		status = EXIT_ERROR;
	}

	std::signal(SIGINT, SIG_DFL);
	active_session = nullptr;
	delete session;
	DebugLogger::system_log = nullptr;
	delete file_log;

	return status;
}
