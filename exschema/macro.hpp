/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Common macros shared by the exschema modules

**************************************************/

#ifndef EXSCHEMA_MACRO_HPP
#define EXSCHEMA_MACRO_HPP

#define EXSCHEMA_NODISCARD [[nodiscard]]

#define EXSCHEMA_FILE_NAME __FILE__
#define EXSCHEMA_FILE_LINE __LINE__

#if defined(__GNUC__) || defined(__clang__)
#define EXSCHEMA_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define EXSCHEMA_FUNC_NAME __FUNCSIG__
#else
#define EXSCHEMA_FUNC_NAME __func__
#endif

#endif  // EXSCHEMA_MACRO_HPP
