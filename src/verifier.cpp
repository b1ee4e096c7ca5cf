/*
 * Copyright 2017-2018 Tom van Dijk, Johannes Kepler University Linz
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <iostream>
#include <string>

#include "roundrobin/verifier.hpp"

namespace rr {

void
Verifier::verify(int n)
{
    check(n, generate(n));
}

bool
Verifier::verify_one(int n, std::string &message)
{
    try {
        verify(n);
        message.clear();
        return true;
    } catch (Error &err) {
        message = err.message();
        return false;
    }
}

TASK_3(int, verify_range_rec, Verifier*, verifier, int, first, int, count)
{
    return verifier->verify_range_rec(__lace_worker, __lace_dq_head, first, count);
}

int
Verifier::verify_range_rec(WorkerP* __lace_worker, Task* __lace_dq_head, int first, int count)
{
    if (count == 1) {
        return verify_one(par_first + 2*first, messages[first]) ? 0 : 1;
    } else {
        int half = count / 2;
        SPAWN(verify_range_rec, this, first+half, count-half);
        int a = CALL(verify_range_rec, this, first, half);
        int b = SYNC(verify_range_rec);
        return a+b;
    }
}

VOID_TASK_1(verify_run_par, Verifier*, _this)
{
    _this->run_par(__lace_worker, __lace_dq_head);
}

void
Verifier::run_par(WorkerP* __lace_worker, Task* __lace_dq_head)
{
    par_failed = CALL(verify_range_rec, this, 0, par_count);
}

int
Verifier::verify_range(int min_n, int max_n)
{
    if (min_n & 1) min_n++;
    if (min_n >= max_n) return 0;

    const int count = (max_n - min_n + 1) / 2;
    int failed = 0;

    if (workers >= 0) {
        par_first = min_n;
        par_count = count;
        par_failed = 0;
        messages.assign(count, std::string());

        // the logger is not shared with the workers
        const int saved_trace = trace;
        trace = 0;

        if (lace_workers() == 0) {
            lace_start(workers, 0);
            logger << "initialized Lace with " << lace_workers() << " workers" << std::endl;
            RUN(verify_run_par, this);
            lace_stop();
        } else {
            logger << "running parallel (Lace already initialized)" << std::endl;
            RUN(verify_run_par, this);
        }
        trace = saved_trace;

        for (int i=0; i<count; i++) {
            const int n = min_n + 2*i;
            if (messages[i].empty()) {
                logger << n << " vertices passed" << std::endl;
            } else {
                logger << "\033[1;31m" << n << " vertices failed\033[m: " << messages[i] << std::endl;
            }
        }
        failed = par_failed;
        messages.clear();
    } else {
        std::string message;
        for (int n=min_n; n<max_n; n+=2) {
            if (verify_one(n, message)) {
                logger << n << " vertices passed" << std::endl;
            } else {
                logger << "\033[1;31m" << n << " vertices failed\033[m: " << message << std::endl;
                failed++;
            }
        }
    }

    return failed;
}

}
