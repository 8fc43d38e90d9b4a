#include <stdio.h>
#include <time.h>
#include <stdlib.h>

#include "engine.hpp"
#include "crc_ref.hpp"

#define FRAMES      200
#define MAX_WORDS   10
#define SEED        280
// Watchdog: every word may be followed by one extra step
#define STEP_BUDGET (FRAMES * 2 * (MAX_WORDS + 1) + 16)

typedef struct {
    int expected;
    int received;
    int violations;
    int steps;
}t_sb_stats;

// Checks one step of engine output against the head of the scoreboard.
static int monitor(t_crc_out out, hls::stream<ap_uint<32> > &scoreboard, t_sb_stats *st, const char* name)
{
    st->steps++;
    if (!out.valid) {
        return 0;
    }
    if (scoreboard.empty()) {
        printf("%s: scoreboard underflow at step %d\n", name, st->steps);
        return 1;
    }

    ap_uint<32> exp = scoreboard.read();
    st->received++;
    if (out.crc != exp) {
        printf("%s: frame %d CRC 0x%08x, expected 0x%08x\n", name, st->received, out.crc.to_uint(), exp.to_uint());
        return 1;
    }
    return 0;
}

/*
 * Drives random back-to-back frames through one engine and checks every valid
 * pulse against an in-order queue of expected results. Idle steps and illegal
 * flag combinations are sprinkled between words; neither may disturb the
 * frame in progress.
 */
static int run(const t_crc_cfg &cfg, const char* name)
{
    t_crc_engine eng;
    hls::stream<ap_uint<32> > scoreboard;
    t_sb_stats st = {0, 0, 0, 0};
    ap_uint<32> words[MAX_WORDS];
    ap_uint<32> running = cfg.seed;
    int f, i;

    crc_init(&eng, cfg);

    for (f = 0; f < FRAMES; f++) {
        int len = (cfg.mode == MODE_FRAME) ? 1 + rand() % MAX_WORDS : 1;

        for (i = 0; i < len; i++) {
            words[i] = rand32();
        }

        for (i = 0; i < len; i++) {
            t_crc_in din = {words[i], 1, (i == 0), (i == len - 1)};
            t_crc_out out;

            if (cfg.mode == MODE_SINGLE_WORD) {
                // One result per word, chained from the first start flag.
                din.sof = (f == 0);
                din.eof = 0;
                crc32_ref_word(cfg.poly, words[i], &running);
                scoreboard.write((cfg.finalize == FINAL_COMPLEMENT) ? (ap_uint<32>) ~running : running);
                st.expected++;
            } else if (i == len - 1) {
                scoreboard.write(crc32_ref_frame(cfg, words, len));
                st.expected++;
            }

            out = crc_step(&eng, din);
            if (out.sof_err || out.eof_err) {
                printf("%s: unexpected violation at step %d\n", name, st.steps + 1);
                return 1;
            }
            if (monitor(out, scoreboard, &st, name)) return 1;

            // Occasional illegal flags in the middle of a frame
            if ((cfg.mode == MODE_FRAME) && (i < len - 1) && (rand() % 8 == 0)) {
                t_crc_in bad = {rand32(), 0, (rand() & 1), 1};

                out = crc_step(&eng, bad);
                st.violations++;
                if (!out.eof_err) {
                    printf("%s: violation not reported at step %d\n", name, st.steps + 1);
                    return 1;
                }
                if (monitor(out, scoreboard, &st, name)) return 1;
            }
        }

        // Most frames go back to back, some leave an idle step behind.
        if (rand() % 4 == 0) {
            t_crc_in idle = {rand32(), 0, 0, 0};
            if (monitor(crc_step(&eng, idle), scoreboard, &st, name)) return 1;
        }

        if (st.steps > STEP_BUDGET) {
            printf("%s: watchdog expired after %d steps\n", name, st.steps);
            return 1;
        }
    }

    // Drain
    while (!scoreboard.empty()) {
        t_crc_in idle = {0, 0, 0, 0};
        if (monitor(crc_step(&eng, idle), scoreboard, &st, name)) return 1;
        if (st.steps > STEP_BUDGET) {
            printf("%s: watchdog expired with %d frames outstanding\n", name, st.expected - st.received);
            return 1;
        }
    }

    printf("%s: %d/%d frames, %d violations, %d steps\n", name, st.received, st.expected, st.violations, st.steps);
    return (st.received == st.expected) ? 0 : 1;
}

int main()
{
    srand(SEED); //time(NULL));

    if (run(CRC_CFG_FRAME_REV, "FRAME_REV")) return 1;
    if (run(CRC_CFG_SINGLE_FWD, "SINGLE_FWD")) return 1;

    printf("Scoreboard tests passed\n");
    return 0;
}
