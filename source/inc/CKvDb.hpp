/**
 * @file CKvDb.hpp
 * @brief SQLite backed key-value database with a string view and a JSON view
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */
#ifndef LAP_KVDB_KVDB_HPP
#define LAP_KVDB_KVDB_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// kvdb common
#include "CDataType.hpp"
#include "CKvDbErrorDomain.hpp"
#include "CKvDbConfig.hpp"

// views
#include "CKvDbSequence.hpp"
#include "CKvDbView.hpp"

#include "CKeyValueDb.hpp"

#endif
