/******************************************************************************
*
*	CAEN SpA - Software Division
*	Via Vetraia, 11 - 55049 - Viareggio ITALY
*	+39 0594 388 398 - www.caen.it
*
*******************************************************************************
*
*	Copyright (C) 2020-2023 CAEN SpA
*
*	This file is part of the ECHONET Lite Discovery Library.
*
*	The ECHONET Lite Discovery Library is free software; you can redistribute
*	it and/or modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	The ECHONET Lite Discovery Library is distributed in the hope that it will
*	be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with the ECHONET Lite Discovery Library; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		ECHONETDiscovery.h
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_ECHONETDISCOVERY_H_
#define ECHONET_INCLUDE_ECHONETDISCOVERY_H_

#include <stddef.h>

#define ECHONET_DISCOVERY_STR_HELPER(S)		#S
#define ECHONET_DISCOVERY_STR(S)			ECHONET_DISCOVERY_STR_HELPER(S)

#define ECHONET_DISCOVERY_VERSION_MAJOR		1
#define ECHONET_DISCOVERY_VERSION_MINOR		0
#define ECHONET_DISCOVERY_VERSION_PATCH		0
#define ECHONET_DISCOVERY_VERSION			(ECHONET_DISCOVERY_VERSION_MAJOR * 10000) + (ECHONET_DISCOVERY_VERSION_MINOR * 100) + (ECHONET_DISCOVERY_VERSION_PATCH)
#define ECHONET_DISCOVERY_VERSION_STRING	ECHONET_DISCOVERY_STR(ECHONET_DISCOVERY_VERSION_MAJOR) "." ECHONET_DISCOVERY_STR(ECHONET_DISCOVERY_VERSION_MINOR) "." ECHONET_DISCOVERY_STR(ECHONET_DISCOVERY_VERSION_PATCH)

#ifdef _WIN32
#define ECHONET_DISCOVERY_API		__stdcall
#ifdef ECHONET_DISCOVERY_EXPORTS
#define ECHONET_DISCOVERY_DLLAPI	__declspec(dllexport)
#else
#define ECHONET_DISCOVERY_DLLAPI	__declspec(dllimport)
#endif
#else
#define ECHONET_DISCOVERY_API
#define ECHONET_DISCOVERY_DLLAPI	__attribute__((visibility("default")))
#endif

/*!
 * @brief Error codes returned by every function of the library.
 */
typedef enum {
	ECHONETDiscovery_Success			= 0,	//!< Operation completed successfully
	ECHONETDiscovery_GenericError		= -1,	//!< Unspecified error
	ECHONETDiscovery_InvalidParam		= -2,	//!< Invalid parameter (null pointer, malformed URL, ...)
	ECHONETDiscovery_BindError			= -3,	//!< Socket setup failed (permissions, port in use, ...)
	ECHONETDiscovery_SendError			= -4,	//!< Broadcast transmission failed (unreachable, no route, ...)
	ECHONETDiscovery_ReceiveError		= -5,	//!< Collection aborted by a transport error: partial results are still provided
	ECHONETDiscovery_InvalidState		= -6,	//!< Operation invoked on a session that is not open
	ECHONETDiscovery_InternalError		= -7,	//!< Internal error
} ECHONETDiscovery_ErrorCode;

#ifdef __cplusplus
extern "C" {
#endif

ECHONET_DISCOVERY_DLLAPI int ECHONET_DISCOVERY_API ECHONETDiscovery_GetLibVersion(char version[16]);

ECHONET_DISCOVERY_DLLAPI int ECHONET_DISCOVERY_API ECHONETDiscovery_GetLastError(char description[1024]);

ECHONET_DISCOVERY_DLLAPI int ECHONET_DISCOVERY_API ECHONETDiscovery_GetDefaultBroadcastAddress(char address[16]);

/*!
 * @brief Broadcast the instance list request and collect the replies.
 *
 * The URL has the form `echonet://[address][:port][?duration=MS&bind_port=N&log_level=LEVEL]`.
 * On success, and on ECHONETDiscovery_ReceiveError, @p jsonString is filled with an array of
 * `{ "address", "port", "payload" }` objects, in arrival order, with the payload hex encoded.
 * @param[in] url			the discovery URL (the "echonet://" scheme is optional)
 * @param[out] jsonString	the output buffer
 * @param[in] size			the size of @p jsonString, including the null terminator
 * @return an ECHONETDiscovery_ErrorCode
 */
ECHONET_DISCOVERY_DLLAPI int ECHONET_DISCOVERY_API ECHONETDiscovery_Discover(const char* url, char* jsonString, size_t size);

#ifdef __cplusplus
}
#endif

#endif /* ECHONET_INCLUDE_ECHONETDISCOVERY_H_ */
