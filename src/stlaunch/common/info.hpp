#pragma once

const char* get_version_full();
