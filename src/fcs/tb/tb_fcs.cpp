#include <stdio.h>
#include <time.h>
#include <stdlib.h>

#include "fcs.hpp"
#include "crc_ref.hpp"

#define CYCLES 100
#define SEED   280

typedef struct {
    t_poly_form  poly;
    t_crc_final  finalize;
    ap_uint<32>  din;
    ap_uint<32>  crc;
}t_golden;

// Single-word frames, seeded with 0xffffffff
t_golden golden[] = {
    {POLY_REVERSED, FINAL_COMPLEMENT, 0x12345678, 0xaf6d87d2},
    {POLY_REVERSED, FINAL_COMPLEMENT, 0x00000000, 0x2144df1c},
    {POLY_REVERSED, FINAL_COMPLEMENT, 0xffffffff, 0xffffffff},
    {POLY_REVERSED, FINAL_COMPLEMENT, 0x12345679, 0x17d1e0b7},
    {POLY_FORWARD,  FINAL_IDENTITY,   0x12345678, 0xdf8a8a2b},
    {POLY_FORWARD,  FINAL_IDENTITY,   0x00000000, 0xc704dd7b},
    {POLY_FORWARD,  FINAL_IDENTITY,   0xffffffff, 0x00000000},
    {POLY_FORWARD,  FINAL_IDENTITY,   0x12345679, 0xdb4b979c},
};

#define GOLDEN_CNT (sizeof(golden) / sizeof(t_golden))

static const char* form_name(t_poly_form poly){
    return (poly == POLY_FORWARD) ? "FWD" : "REV";
}

static int test_golden(){
    unsigned i;

    for (i = 0; i < GOLDEN_CNT; i++) {
        ap_uint<32> state = crc32_next(golden[i].poly, CRC32_SEED, 0, golden[i].din, 1);
        ap_uint<32> crc = crc32_final(golden[i].finalize, state);
        ap_uint<32> ref = CRC32_SEED;

        crc32_ref_word(golden[i].poly, golden[i].din, &ref);
        ref = crc32_final(golden[i].finalize, ref);

        printf("%s DIN = 0x%08x, CRC = 0x%08x, REF = 0x%08x, GOLDEN = 0x%08x\n",
               form_name(golden[i].poly), golden[i].din.to_uint(), crc.to_uint(),
               ref.to_uint(), golden[i].crc.to_uint());
        if ((crc != golden[i].crc) || (ref != golden[i].crc)) {
            return 1;
        }
    }
    return 0;
}

// Word-parallel update against the byte-serial reference, over a running stream.
static int test_stream(t_poly_form poly){
    int j;
    ap_uint<32> crc_state = CRC32_SEED;
    ap_uint<32> crc_state_8b = CRC32_SEED;

    for (j = 0; j < CYCLES; j++) {
        ap_uint<32> din = rand32();

        crc32_ref_word(poly, din, &crc_state_8b);
        crc_state = crc32_next(poly, CRC32_SEED, crc_state, din, 0);
        if (crc_state != crc_state_8b) {
            printf("%s DIN = 0x%08x, CRC - 32b: 0x%08x, CRC - 8b: 0x%08x\n", form_name(poly),
                   din.to_uint(), crc_state.to_uint(), crc_state_8b.to_uint());
            return 1;
        }
    }
    return 0;
}

// The start flag replaces the current state with the seed.
static int test_seed_select(){
    ap_uint<32> din = 0x12345678;
    ap_uint<32> a = crc32_next(POLY_REVERSED, CRC32_SEED, 0xdeadbeef, din, 1);
    ap_uint<32> b = crc32_next(POLY_REVERSED, CRC32_SEED, CRC32_SEED, din, 0);
    ap_uint<32> c = crc32_next(POLY_REVERSED, CRC32_SEED, 0xdeadbeef, din, 0);

    if ((a != b) || (a == c)) {
        printf("SEED SELECT: 0x%08x 0x%08x 0x%08x\n", a.to_uint(), b.to_uint(), c.to_uint());
        return 1;
    }
    return 0;
}

// Both polynomial representations describe the same LFSR, mirrored.
static int test_cross_form(){
    int j;

    for (j = 0; j < CYCLES; j++) {
        ap_uint<32> state = rand32();
        ap_uint<32> din = rand32();
        ap_uint<32> fwd = crc32_next(POLY_FORWARD, CRC32_SEED, bit_reverse32(state), bit_reverse32(din), 0);
        ap_uint<32> rev = crc32_next(POLY_REVERSED, CRC32_SEED, state, din, 0);

        if (fwd != bit_reverse32(rev)) {
            printf("CROSS DIN = 0x%08x, FWD 0x%08x, REV 0x%08x\n", din.to_uint(), fwd.to_uint(), rev.to_uint());
            return 1;
        }
    }
    return 0;
}

static int test_avalanche(t_poly_form poly){
    int j, b;

    for (j = 0; j < CYCLES; j++) {
        ap_uint<32> din = rand32();
        ap_uint<32> crc = crc32_next(poly, CRC32_SEED, 0, din, 1);

        for (b = 0; b < 32; b++) {
            ap_uint<32> flipped = din ^ ((ap_uint<32>) 1 << b);
            if (crc32_next(poly, CRC32_SEED, 0, flipped, 1) == crc) {
                printf("%s COLLISION DIN = 0x%08x, BIT %d\n", form_name(poly), din.to_uint(), b);
                return 1;
            }
        }
    }
    return 0;
}

// Appending the finalized CRC word lands the accumulator on the residue,
// for every pairing of polynomial form and finalization.
static int test_residue(){
    int j, k;
    t_poly_form polys[2] = {POLY_REVERSED, POLY_FORWARD};
    t_crc_final finals[2] = {FINAL_COMPLEMENT, FINAL_IDENTITY};
    ap_uint<32> expect[2][2] = {
        {CRC32_RESIDUE_CPL,     CRC32_RESIDUE_ID},
        {CRC32_RESIDUE_FWD_CPL, CRC32_RESIDUE_ID},
    };

    for (k = 0; k < 4; k++) {
        t_poly_form poly = polys[k / 2];
        t_crc_final fin = finals[k % 2];

        if (crc32_residue(poly, fin) != expect[k / 2][k % 2]) {
            printf("%s RESIDUE CONSTANT 0x%08x\n", form_name(poly), crc32_residue(poly, fin).to_uint());
            return 1;
        }
        for (j = 0; j < CYCLES; j++) {
            ap_uint<32> din = rand32();
            ap_uint<32> state = crc32_next(poly, CRC32_SEED, 0, din, 1);

            state = crc32_next(poly, CRC32_SEED, state, crc32_final(fin, state), 0);
            if (state != expect[k / 2][k % 2]) {
                printf("%s FINAL %d RESIDUE DIN = 0x%08x, STATE 0x%08x\n", form_name(poly), (int) fin,
                       din.to_uint(), state.to_uint());
                return 1;
            }
        }
    }
    return 0;
}

int main()
{
    srand(SEED); //time(NULL));

    if (test_golden()) return 1;
    if (test_stream(POLY_REVERSED)) return 1;
    if (test_stream(POLY_FORWARD)) return 1;
    if (test_seed_select()) return 1;
    if (test_cross_form()) return 1;
    if (test_avalanche(POLY_REVERSED)) return 1;
    if (test_avalanche(POLY_FORWARD)) return 1;
    if (test_residue()) return 1;

    printf("FCS tests passed\n");
    return 0;
}
