#include <politeia/secure/network.hpp>

politeia::network_params::network_params (dcr_networks network_a) :
network (network_a)
{
	switch (network)
	{
		case dcr_networks::mainnet:
			name = "mainnet";
			pubkey_hash_addr_id = 0x073f; // Ds
			pkh_edwards_addr_id = 0x071f; // De
			pkh_schnorr_addr_id = 0x0701; // DS
			script_hash_addr_id = 0x071a; // Dc
			pubkey_addr_id = 0x1386; // Dk
			ticket_maturity = 256;
			default_dcrdata_url = "https://dcrdata.org:443/";
			break;
		case dcr_networks::testnet:
			name = "testnet";
			pubkey_hash_addr_id = 0x0f21; // Ts
			pkh_edwards_addr_id = 0x0f01; // Te
			pkh_schnorr_addr_id = 0x0ee3; // TS
			script_hash_addr_id = 0x0efc; // Tc
			pubkey_addr_id = 0x28f7; // Tk
			ticket_maturity = 16;
			default_dcrdata_url = "https://testnet.dcrdata.org:443/";
			break;
		case dcr_networks::simnet:
			name = "simnet";
			pubkey_hash_addr_id = 0x0e91; // Ss
			pkh_edwards_addr_id = 0x0e71; // Se
			pkh_schnorr_addr_id = 0x0e53; // SS
			script_hash_addr_id = 0x0e6c; // Sc
			pubkey_addr_id = 0x276f; // Sk
			ticket_maturity = 16;
			default_dcrdata_url = "http://127.0.0.1:7777/";
			break;
	}
}

bool politeia::network_params::parse (std::string const & name_a, dcr_networks & network_a)
{
	auto error (false);
	if (name_a == "mainnet")
	{
		network_a = dcr_networks::mainnet;
	}
	else if (name_a == "testnet" || name_a == "testnet3")
	{
		network_a = dcr_networks::testnet;
	}
	else if (name_a == "simnet")
	{
		network_a = dcr_networks::simnet;
	}
	else
	{
		error = true;
	}
	return error;
}
