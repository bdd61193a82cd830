/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "storage_adapter.h"
#include "../util/log.h"

namespace recset {
    namespace persist {

        TransactionScope::TransactionScope(StorageAdapter& adapter)
            : adapter_(adapter), owned_(!adapter.in_transaction()), done_(false) {
            if (owned_) {
                adapter_.begin();
            }
        }

        TransactionScope::~TransactionScope() {
            if (!owned_ || done_) {
                return;
            }
            try {
                adapter_.rollback();
                debug() << "storage transaction rolled back";
            } catch (const std::exception& e) {
                // Destructor must not throw
                error() << "rollback failed: " << e.what();
            }
        }

        void TransactionScope::commit() {
            if (owned_ && !done_) {
                adapter_.commit();
            }
            done_ = true;
        }

    } // namespace persist
} // namespace recset
