/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * Exception type for adapter construction and synthesis failures.
 */

#ifndef HERALD_TTS_ERROR_H
#define HERALD_TTS_ERROR_H

#include <stdexcept>
#include <string>

#include "core/herald_status.h"

namespace herald {

class TtsError : public std::runtime_error {
 public:
   TtsError(herald_status_t status, const std::string &message)
       : std::runtime_error(message), status_(status) {}

   herald_status_t status() const { return status_; }

 private:
   herald_status_t status_;
};

}  // namespace herald

#endif  // HERALD_TTS_ERROR_H
