#pragma once

[[noreturn]] void stlaunch_exit(int code);
