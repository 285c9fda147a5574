/**
 * @file megaflow.h
 * @brief Client library for MEGA cloud storage transfers
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the the rules set forth in the Terms of Service.
 *
 * The MEGA SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#ifndef MEGAFLOW_H
#define MEGAFLOW_H 1

#include "megaflow/types.h"
#include "megaflow/error.h"
#include "megaflow/logging.h"
#include "megaflow/base64.h"
#include "megaflow/json.h"
#include "megaflow/crypto/cryptopp.h"
#include "megaflow/filecrypto.h"
#include "megaflow/chunkmac.h"
#include "megaflow/backofftimer.h"
#include "megaflow/http.h"
#include "megaflow/command.h"
#include "megaflow/request.h"
#include "megaflow/publiclink.h"
#include "megaflow/session.h"
#include "megaflow/node.h"
#include "megaflow/nodetree.h"
#include "megaflow/filesystem.h"
#include "megaflow/transfer.h"
#include "megaflow/concurrency_budget.h"
#include "megaflow/scheduler.h"
#include "megaflow/config.h"
#include "megaflow/arguments.h"

#include "megaflow/posix/megafs.h"
#include "megaflow/posix/meganet.h"

#endif
