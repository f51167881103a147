/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#ifndef CLI_COMMON_HXX_
#define CLI_COMMON_HXX_

#include <string>

extern const char MASK_DOTFILE_NAME[];

std::string get_mask_conf_path();
std::string get_mask_from_conf_file();
void do_version();

#endif /* CLI_COMMON_HXX_ */
