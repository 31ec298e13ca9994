#include "console_log.hpp"
#include "timer.hpp"
#include "config_store.hpp"
#include "scheduler.hpp"
#include "logger.hpp"
#include "rtc.hpp"
#include "debug.hpp"

#include "CppUTest/CommandLineTestRunner.h"
#include "CppUTest/TestRegistry.h"
#include "CppUTestExt/MockSupportPlugin.h"

// Global contexts
Timer *system_timer;
Scheduler *system_scheduler;
ConfigurationStore *configuration_store;
RTC *rtc;

MockSupportPlugin mockPlugin;

int main(int argc, char** argv)
{
	ConsoleLog con_log;
	DebugLogger::console_log = &con_log;
    TestRegistry::getCurrentRegistry()->installPlugin(&mockPlugin);
    int exit_code = CommandLineTestRunner::RunAllTests(argc, argv);
    return exit_code;
}
