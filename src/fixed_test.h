#ifndef FIXED_TEST_H_
#define FIXED_TEST_H_

int run_tst_fixed_api_paranoid(int argc, char** argv);

#endif /* FIXED_TEST_H_ */
